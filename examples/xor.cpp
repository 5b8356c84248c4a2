#include <gradnet/gradnet.hpp>

#include <iostream>
#include <vector>

using namespace gradnet;
using namespace gradnet::layers;

namespace {

const long EPOCHS = 1000;
const double LEARNING_RATE = 0.1;
const long LOG_INTERVAL = 100;

void print_predictions(const Sequential<double>& model,
                       const std::vector<Vector<double>>& inputs,
                       const std::vector<Vector<double>>& targets) {
    for (size_t n = 0; n < inputs.size(); ++n) {
        Vector<double> y = model.output(inputs[n]);
        std::cout << "X: [" << inputs[n][0] << ", " << inputs[n][1] << "], "
                  << "Y: [" << y[0] << "], "
                  << "T: [" << targets[n][0] << "]" << std::endl;
    }
}

} // namespace

int main() {
    std::cout << "--- gradnet XOR ---" << std::endl;

    // Two binary inputs, four combinations, one target each
    std::vector<Vector<double>> inputs = {{0, 0}, {0, 1}, {1, 0}, {1, 1}};
    std::vector<Vector<double>> targets = {{0}, {1}, {1}, {0}};

    // Hidden layer of 6 tanh neurons, single sigmoid output
    Sequential<double> model{
        Dense<double>::random(2, 6),
        Hyperbolic<double>(6),
        Dense<double>::random(6, 1),
        Sigmoid<double>(1),
    };

    for (const auto& layer : model.layers()) {
        std::cout << name(layer) << " (" << input_count(layer) << " -> " << output_count(layer) << ")" << std::endl;
    }

    std::cout << "Before training:" << std::endl;
    print_predictions(model, inputs, targets);

    try {
        optim::SGDTrainer<double> trainer(EPOCHS, LEARNING_RATE);
        trainer.train(model, inputs, targets, [](long epoch, double loss) {
            if (epoch % LOG_INTERVAL == 0) {
                std::cout << "Epoch " << epoch << ", Loss: " << loss << std::endl;
            }
        });
    } catch (const std::exception& e) {
        std::cerr << "Training failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "After training:" << std::endl;
    print_predictions(model, inputs, targets);
    return 0;
}
