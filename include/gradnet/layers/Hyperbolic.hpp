#ifndef GRADNET_LAYERS_HYPERBOLIC_HPP
#define GRADNET_LAYERS_HYPERBOLIC_HPP

#include "Activation.hpp"
#include <cmath>
#include <string>

namespace gradnet {
namespace layers {

template <typename T>
class Hyperbolic : public Activation<Hyperbolic<T>, T> {
public:
    explicit Hyperbolic(size_t size) : Activation<Hyperbolic<T>, T>(size) {}

    static T activate(T x) { return std::tanh(x); }

    // y = tanh(x), dy/dx = 1 - y^2
    static T derivative(T /*x*/, T y) { return 1 - y * y; }

    std::string name() const { return "Hyperbolic"; }
};

} // namespace layers
} // namespace gradnet

#endif // GRADNET_LAYERS_HYPERBOLIC_HPP
