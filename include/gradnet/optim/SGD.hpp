#ifndef GRADNET_OPTIM_SGD_HPP
#define GRADNET_OPTIM_SGD_HPP

#include "../core/Errors.hpp"
#include "../core/Vector.hpp"
#include "../loss/SquaredError.hpp"
#include "../model.hpp"
#include <cmath>
#include <string>
#include <vector>

namespace gradnet {
namespace optim {

/**
 * @brief Per-sample stochastic gradient descent.
 *
 * Runs exactly epochs() passes over the training set, one forward and one
 * backward per (input, target) pair in the order given. There is no
 * convergence check. With the default loss the gradient handed to the
 * network is output - target.
 */
template <typename T, typename Loss = loss::HalfSquaredError<T>>
class SGDTrainer {
public:
    SGDTrainer(long epochs, T learning_rate, Loss loss = Loss())
        : epochs_(epochs), learning_rate_(learning_rate), loss_(loss)
    {
        if (epochs_ < 0) {
            throw InvalidConfiguration("SGDTrainer: epochs must be non-negative, got " + std::to_string(epochs_));
        }
        if (!std::isfinite(learning_rate_) || !(learning_rate_ > 0)) {
            throw InvalidConfiguration("SGDTrainer: learning rate must be positive and finite");
        }
    }

    long epochs() const { return epochs_; }
    T learning_rate() const { return learning_rate_; }
    const Loss& loss() const { return loss_; }

    template <typename LayerVariant>
    void train(Sequential<T, LayerVariant>& model,
               const std::vector<Vector<T>>& inputs,
               const std::vector<Vector<T>>& targets) const {
        train(model, inputs, targets, [](long, T) {});
    }

    /**
     * @brief Train and report progress.
     *
     * @param on_epoch Called as on_epoch(epoch, loss) after every epoch, where
     *        loss is the summed loss of the epoch's forward outputs.
     */
    template <typename LayerVariant, typename Callback>
    void train(Sequential<T, LayerVariant>& model,
               const std::vector<Vector<T>>& inputs,
               const std::vector<Vector<T>>& targets,
               Callback on_epoch) const {
        check_dataset(model, inputs, targets);

        for (long epoch = 0; epoch < epochs_; ++epoch) {
            T epoch_loss = 0;
            for (size_t n = 0; n < inputs.size(); ++n) {
                // Forward
                Vector<T> prediction = model.forward(inputs[n]);

                // Loss
                epoch_loss += loss_.total(prediction, targets[n]);
                Vector<T> grad_loss = loss_.gradient(prediction, targets[n]);

                // Backward + update
                model.backward(grad_loss, learning_rate_);
            }
            on_epoch(epoch, epoch_loss);
        }
    }

private:
    template <typename LayerVariant>
    static void check_dataset(const Sequential<T, LayerVariant>& model,
                              const std::vector<Vector<T>>& inputs,
                              const std::vector<Vector<T>>& targets) {
        detail::check_size("SGDTrainer::train", "targets", inputs.size(), targets.size());
        for (size_t n = 0; n < inputs.size(); ++n) {
            detail::check_size("SGDTrainer::train", ("input " + std::to_string(n)).c_str(),
                               model.input_count(), inputs[n].size());
            detail::check_size("SGDTrainer::train", ("target " + std::to_string(n)).c_str(),
                               model.output_count(), targets[n].size());
        }
    }

    long epochs_;
    T learning_rate_;
    Loss loss_;
};

} // namespace optim
} // namespace gradnet

#endif // GRADNET_OPTIM_SGD_HPP
