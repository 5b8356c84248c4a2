#ifndef GRADNET_HPP
#define GRADNET_HPP

// Core
#include "core/Errors.hpp"
#include "core/Vector.hpp"

// Layers
#include "layers/Layer.hpp"

// Model
#include "model.hpp"

// Loss + Optimizer
#include "loss/SquaredError.hpp"
#include "optim/SGD.hpp"

#endif // GRADNET_HPP
