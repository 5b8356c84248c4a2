#ifndef GRADNET_LAYERS_ACTIVATION_HPP
#define GRADNET_LAYERS_ACTIVATION_HPP

#include "../core/Errors.hpp"
#include "../core/Vector.hpp"

namespace gradnet {
namespace layers {

/**
 * @brief Parameter-free elementwise layer.
 *
 * Derived supplies
 *   static T activate(T x);
 *   static T derivative(T x, T y);   // dy/dx, given x and y = activate(x)
 * The layer keeps no state besides its size; the input gradient recomputes
 * the forward value from the input it is handed.
 */
template <typename Derived, typename T>
class Activation {
public:
    explicit Activation(size_t size) : size_(size) {
        if (size_ == 0) {
            throw InvalidConfiguration("Activation: size must be non-zero");
        }
    }

    size_t size() const { return size_; }
    size_t input_count() const { return size_; }
    size_t output_count() const { return size_; }

    Vector<T> output(const Vector<T>& input) const {
        detail::check_size("Activation::output", "input", size_, input.size());
        Vector<T> out(size_);
        for (size_t k = 0; k < size_; ++k) {
            out[k] = Derived::activate(input[k]);
        }
        return out;
    }

    Vector<T> input_gradient(const Vector<T>& input, const Vector<T>& output_gradient) const {
        detail::check_size("Activation::input_gradient", "input", size_, input.size());
        detail::check_size("Activation::input_gradient", "output gradient", size_, output_gradient.size());

        // dL/dx = dL/dy * dy/dx
        Vector<T> grad_input(size_);
        for (size_t k = 0; k < size_; ++k) {
            T x = input[k];
            grad_input[k] = output_gradient[k] * Derived::derivative(x, Derived::activate(x));
        }
        return grad_input;
    }

    // No parameters. Shapes are still checked so misuse fails the same way as Dense.
    void update(const Vector<T>& input, const Vector<T>& output_gradient, T /*learning_rate*/) {
        detail::check_size("Activation::update", "input", size_, input.size());
        detail::check_size("Activation::update", "output gradient", size_, output_gradient.size());
    }

private:
    size_t size_;
};

} // namespace layers
} // namespace gradnet

#endif // GRADNET_LAYERS_ACTIVATION_HPP
