#ifndef GRADNET_LAYERS_LAYER_HPP
#define GRADNET_LAYERS_LAYER_HPP

#include "../core/Vector.hpp"
#include "Dense.hpp"
#include "Hyperbolic.hpp"
#include "Rectified.hpp"
#include "Sigmoid.hpp"
#include <string>
#include <variant>

namespace gradnet {
namespace layers {

// A layer is any type offering
//
//   size_t    input_count() const;
//   size_t    output_count() const;
//   Vector<T> output(const Vector<T>& input) const;
//   Vector<T> input_gradient(const Vector<T>& input, const Vector<T>& output_gradient) const;
//   void      update(const Vector<T>& input, const Vector<T>& output_gradient, T learning_rate);
//   std::string name() const;
//
// A network stores its layers as alternatives of a std::variant and
// dispatches through the free functions below.

template <typename T>
using StandardLayer = std::variant<Dense<T>, Hyperbolic<T>, Sigmoid<T>, Rectified<T>>;

template <typename... L>
size_t input_count(const std::variant<L...>& layer) {
    return std::visit([](const auto& l) { return l.input_count(); }, layer);
}

template <typename... L>
size_t output_count(const std::variant<L...>& layer) {
    return std::visit([](const auto& l) { return l.output_count(); }, layer);
}

template <typename... L>
std::string name(const std::variant<L...>& layer) {
    return std::visit([](const auto& l) { return l.name(); }, layer);
}

/**
 * @brief Forward transform. Does not modify the layer.
 */
template <typename T, typename... L>
Vector<T> output(const std::variant<L...>& layer, const Vector<T>& input) {
    return std::visit([&](const auto& l) { return l.output(input); }, layer);
}

/**
 * @brief Gradient of the loss w.r.t. the layer input.
 *
 * @param input The vector that was fed forward through this layer.
 * @param output_gradient Gradient w.r.t. the layer output.
 */
template <typename T, typename... L>
Vector<T> input_gradient(const std::variant<L...>& layer, const Vector<T>& input,
                         const Vector<T>& output_gradient) {
    return std::visit([&](const auto& l) { return l.input_gradient(input, output_gradient); }, layer);
}

/**
 * @brief One gradient descent step on the layer parameters, if any.
 */
template <typename T, typename... L>
void update(std::variant<L...>& layer, const Vector<T>& input,
            const Vector<T>& output_gradient, T learning_rate) {
    std::visit([&](auto& l) { l.update(input, output_gradient, learning_rate); }, layer);
}

} // namespace layers
} // namespace gradnet

#endif // GRADNET_LAYERS_LAYER_HPP
