#ifndef GRADNET_LAYERS_DENSE_HPP
#define GRADNET_LAYERS_DENSE_HPP

#include "../core/Errors.hpp"
#include "../core/Vector.hpp"
#include "../utils/VectorOps.hpp"
#include <cmath>
#include <random>
#include <string>
#include <utility>

namespace gradnet {
namespace layers {

/**
 * @brief Fully connected affine layer, y = W x + b.
 *
 * W has shape (output_dim, input_dim) and is stored row-major, so the weights
 * feeding output neuron j are contiguous at [j * input_dim, (j + 1) * input_dim).
 */
template <typename T>
class Dense {
public:
    Dense(size_t input_dim, size_t output_dim, Vector<T> weights, Vector<T> bias)
        : input_dim_(input_dim), output_dim_(output_dim),
          weights_(std::move(weights)), bias_(std::move(bias))
    {
        if (input_dim_ == 0 || output_dim_ == 0) {
            throw InvalidConfiguration("Dense: input and output dimensions must be non-zero");
        }
        detail::check_size("Dense", "weights", input_dim_ * output_dim_, weights_.size());
        detail::check_size("Dense", "bias", output_dim_, bias_.size());
    }

    // Every weight and bias set to the same value.
    static Dense filled(T value, size_t input_dim, size_t output_dim) {
        return Dense(input_dim, output_dim,
                     Vector<T>(input_dim * output_dim, value),
                     Vector<T>(output_dim, value));
    }

    // Independent uniform(-1, 1) draws for every weight and bias.
    template <typename Generator>
    static Dense random(size_t input_dim, size_t output_dim, Generator& gen) {
        std::uniform_real_distribution<T> d(-1, 1);
        Vector<T> weights(input_dim * output_dim);
        Vector<T> bias(output_dim);
        for (auto& w : weights) w = d(gen);
        for (auto& b : bias) b = d(gen);
        return Dense(input_dim, output_dim, std::move(weights), std::move(bias));
    }

    static Dense seeded(size_t input_dim, size_t output_dim, unsigned int seed) {
        std::mt19937 gen(seed);
        return random(input_dim, output_dim, gen);
    }

    static Dense random(size_t input_dim, size_t output_dim) {
        std::random_device rd;
        std::mt19937 gen(rd());
        return random(input_dim, output_dim, gen);
    }

    // Xavier/Glorot Initialization (Normal), zero bias
    template <typename Generator>
    static Dense normal(size_t input_dim, size_t output_dim, Generator& gen) {
        // stddev = sqrt(2 / (in + out))
        T stddev = std::sqrt(T(2) / T(input_dim + output_dim));
        std::normal_distribution<T> d(0, stddev);
        Vector<T> weights(input_dim * output_dim);
        for (auto& w : weights) w = d(gen);
        return Dense(input_dim, output_dim, std::move(weights), Vector<T>(output_dim, 0));
    }

    size_t input_count() const { return input_dim_; }
    size_t output_count() const { return output_dim_; }

    Vector<T> output(const Vector<T>& input) const {
        detail::check_size("Dense::output", "input", input_dim_, input.size());

        Vector<T> out(output_dim_);
        for (size_t j = 0; j < output_dim_; ++j) {
            out[j] = bias_[j] + utils::dot(&weights_[j * input_dim_], input.data(), input_dim_);
        }
        return out;
    }

    Vector<T> input_gradient(const Vector<T>& input, const Vector<T>& output_gradient) const {
        detail::check_size("Dense::input_gradient", "input", input_dim_, input.size());
        detail::check_size("Dense::input_gradient", "output gradient", output_dim_, output_gradient.size());

        // dL/dx = W^T * dL/dy
        Vector<T> grad_input(input_dim_, 0);
        for (size_t j = 0; j < output_dim_; ++j) {
            utils::axpy_mut(grad_input.data(), output_gradient[j], &weights_[j * input_dim_], input_dim_);
        }
        return grad_input;
    }

    void update(const Vector<T>& input, const Vector<T>& output_gradient, T learning_rate) {
        detail::check_size("Dense::update", "input", input_dim_, input.size());
        detail::check_size("Dense::update", "output gradient", output_dim_, output_gradient.size());

        // dL/dW[j][i] = dL/dy[j] * x[i], dL/db[j] = dL/dy[j]
        for (size_t j = 0; j < output_dim_; ++j) {
            T step = learning_rate * output_gradient[j];
            utils::axpy_mut(&weights_[j * input_dim_], -step, input.data(), input_dim_);
            bias_[j] -= step;
        }
    }

    const Vector<T>& weights() const { return weights_; }
    const Vector<T>& bias() const { return bias_; }
    T weight(size_t j, size_t i) const { return weights_[j * input_dim_ + i]; }

    size_t weight_count() const { return weights_.size(); }
    size_t neuron_count() const { return output_dim_; }

    std::string name() const { return "Dense"; }

private:
    size_t input_dim_;
    size_t output_dim_;

    Vector<T> weights_;
    Vector<T> bias_;
};

} // namespace layers
} // namespace gradnet

#endif // GRADNET_LAYERS_DENSE_HPP
