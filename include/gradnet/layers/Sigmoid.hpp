#ifndef GRADNET_LAYERS_SIGMOID_HPP
#define GRADNET_LAYERS_SIGMOID_HPP

#include "Activation.hpp"
#include <cmath>
#include <string>

namespace gradnet {
namespace layers {

template <typename T>
class Sigmoid : public Activation<Sigmoid<T>, T> {
public:
    explicit Sigmoid(size_t size) : Activation<Sigmoid<T>, T>(size) {}

    static T activate(T x) { return 1 / (1 + std::exp(-x)); }

    // dy/dx = y (1 - y)
    static T derivative(T /*x*/, T y) { return y * (1 - y); }

    std::string name() const { return "Sigmoid"; }
};

} // namespace layers
} // namespace gradnet

#endif // GRADNET_LAYERS_SIGMOID_HPP
