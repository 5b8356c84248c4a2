#ifndef GRADNET_MODEL_HPP
#define GRADNET_MODEL_HPP

#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/Errors.hpp"
#include "core/Vector.hpp"
#include "layers/Layer.hpp"

namespace gradnet {

/**
 * @brief Ordered stack of layers.
 *
 * The layer sequence is fixed at construction, where adjacent widths are
 * checked. forward() records the input of every layer; the following
 * backward() consumes those records to update the layers in reverse order.
 */
template <typename T, typename LayerVariant = layers::StandardLayer<T>>
class Sequential {
public:
    using layer_type = LayerVariant;

    explicit Sequential(std::vector<LayerVariant> stack) : layers_(std::move(stack)) {
        validate();
    }

    Sequential(std::initializer_list<LayerVariant> stack) : layers_(stack) {
        validate();
    }

    size_t size() const { return layers_.size(); }
    size_t input_count() const { return layers::input_count(layers_.front()); }
    size_t output_count() const { return layers::output_count(layers_.back()); }

    const std::vector<LayerVariant>& layers() const { return layers_; }

    // Inference only; nothing is cached.
    Vector<T> output(const Vector<T>& input) const {
        detail::check_size("Sequential::output", "input", input_count(), input.size());
        Vector<T> out = input;
        for (const auto& layer : layers_) {
            out = layers::output(layer, out);
        }
        return out;
    }

    Vector<T> forward(const Vector<T>& input) {
        detail::check_size("Sequential::forward", "input", input_count(), input.size());

        cached_inputs_.clear();
        cached_inputs_.reserve(layers_.size());

        Vector<T> out = input;
        for (const auto& layer : layers_) {
            Vector<T> next = layers::output(layer, out);
            cached_inputs_.push_back(std::move(out));
            out = std::move(next);
        }
        return out;
    }

    /**
     * @brief Backpropagate a gradient and update every layer.
     *
     * For each layer, last to first, the parameters are updated first and the
     * gradient w.r.t. the layer input is computed afterwards and handed to the
     * preceding layer. The gradient leaving the first layer is dropped.
     *
     * @param output_gradient Gradient of the loss w.r.t. the network output.
     * @param learning_rate Step size.
     */
    void backward(const Vector<T>& output_gradient, T learning_rate) {
        if (!has_cached_forward()) {
            throw std::logic_error("Sequential::backward called without a preceding forward");
        }
        detail::check_size("Sequential::backward", "output gradient", output_count(), output_gradient.size());

        // Invalidate the cache up front so a throwing layer cannot leave a stale one.
        std::vector<Vector<T>> inputs = std::move(cached_inputs_);
        cached_inputs_.clear();

        Vector<T> grad = output_gradient;
        for (size_t i = layers_.size(); i-- > 0;) {
            layers::update(layers_[i], inputs[i], grad, learning_rate);
            if (i > 0) {
                grad = layers::input_gradient(layers_[i], inputs[i], grad);
            }
        }
    }

    bool has_cached_forward() const { return cached_inputs_.size() == layers_.size(); }

private:
    void validate() const {
        if (layers_.empty()) {
            throw InvalidConfiguration("Sequential: a network needs at least one layer");
        }
        for (size_t i = 0; i + 1 < layers_.size(); ++i) {
            size_t out = layers::output_count(layers_[i]);
            size_t in = layers::input_count(layers_[i + 1]);
            if (out != in) {
                throw ShapeMismatch("Sequential: layer " + std::to_string(i) + " (" +
                                    layers::name(layers_[i]) + ") outputs " + std::to_string(out) +
                                    " values but layer " + std::to_string(i + 1) + " (" +
                                    layers::name(layers_[i + 1]) + ") expects " + std::to_string(in));
            }
        }
    }

    std::vector<LayerVariant> layers_;

    // Input of every layer from the last forward pass, in layer order.
    std::vector<Vector<T>> cached_inputs_;
};

} // namespace gradnet

#endif // GRADNET_MODEL_HPP
