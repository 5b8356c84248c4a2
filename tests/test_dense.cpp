#include <gradnet/layers/Dense.hpp>

#include <cmath>
#include <iostream>
#include <random>
#include <vector>

using namespace gradnet;
using namespace gradnet::layers;

namespace {

bool near(double a, double b, double tol = 1e-12) {
    return std::abs(a - b) <= tol;
}

// Input width 2, three neurons.
Dense<double> make_layer() {
    return Dense<double>(2, 3, {0.5, 2.0, -1.0, 0.5, 2.0, 3.0}, {0.1, 0.2, 0.3});
}

} // namespace

bool check_output() {
    std::cout << "[Test] Dense Output..." << std::endl;
    Dense<double> layer = make_layer();

    Vector<double> out = layer.output({1.0, -1.0});
    Vector<double> expected = {-1.4, -1.3, -0.7};
    if (out.size() != 3) {
        std::cout << "FAIL: output has " << out.size() << " values" << std::endl;
        return false;
    }
    for (size_t j = 0; j < 3; ++j) {
        if (!near(out[j], expected[j])) {
            std::cout << "FAIL: out[" << j << "] = " << out[j] << ", expected " << expected[j] << std::endl;
            return false;
        }
    }
    std::cout << "PASS" << std::endl;
    return true;
}

bool check_zero_input_returns_bias() {
    std::cout << "[Test] Dense Zero Input -> Bias..." << std::endl;
    for (unsigned int seed = 0; seed < 5; ++seed) {
        Dense<double> layer = Dense<double>::seeded(3 + seed, 4, seed);
        Vector<double> out = layer.output(Vector<double>(3 + seed, 0.0));
        if (out != layer.bias()) {
            std::cout << "FAIL: output of zero vector differs from bias (seed " << seed << ")" << std::endl;
            return false;
        }
    }
    std::cout << "PASS" << std::endl;
    return true;
}

bool check_input_gradient() {
    std::cout << "[Test] Dense Input Gradient..." << std::endl;
    Dense<double> layer = make_layer();

    // W^T * [1, 1, 1] = column sums
    Vector<double> grad = layer.input_gradient({1.0, 2.0}, {1.0, 1.0, 1.0});
    if (grad.size() != 2 || !near(grad[0], 1.5) || !near(grad[1], 5.5)) {
        std::cout << "FAIL: expected [1.5, 5.5]" << std::endl;
        return false;
    }

    // Pure: no parameter change
    if (layer.weights() != make_layer().weights() || layer.bias() != make_layer().bias()) {
        std::cout << "FAIL: input_gradient modified the layer" << std::endl;
        return false;
    }
    std::cout << "PASS" << std::endl;
    return true;
}

bool check_update() {
    std::cout << "[Test] Dense Update..." << std::endl;
    Dense<double> layer(2, 1, {0.5, -0.5}, {0.25});

    // w -= 0.1 * 2 * x, b -= 0.1 * 2
    layer.update({1.0, 2.0}, {2.0}, 0.1);

    if (!near(layer.weight(0, 0), 0.3) || !near(layer.weight(0, 1), -0.9) || !near(layer.bias()[0], 0.05)) {
        std::cout << "FAIL: got w = [" << layer.weight(0, 0) << ", " << layer.weight(0, 1)
                  << "], b = " << layer.bias()[0] << std::endl;
        return false;
    }
    std::cout << "PASS" << std::endl;
    return true;
}

bool check_shape_errors() {
    std::cout << "[Test] Dense Shape Errors..." << std::endl;
    Dense<double> layer = make_layer();
    int caught = 0;

    try { layer.output({1.0, 2.0, 3.0}); } catch (const ShapeMismatch&) { caught++; }
    try { layer.output({}); } catch (const ShapeMismatch&) { caught++; }
    try { layer.input_gradient({1.0, 2.0}, {1.0, 1.0}); } catch (const ShapeMismatch&) { caught++; }
    try { layer.input_gradient({1.0}, {1.0, 1.0, 1.0}); } catch (const ShapeMismatch&) { caught++; }
    try { layer.update({1.0, 2.0}, {1.0}, 0.1); } catch (const ShapeMismatch&) { caught++; }
    try { Dense<double>(2, 3, {1.0, 2.0}, {0.0, 0.0, 0.0}); } catch (const ShapeMismatch&) { caught++; }
    try { Dense<double>(2, 3, Vector<double>(6, 0.0), {0.0}); } catch (const ShapeMismatch&) { caught++; }
    try { Dense<double>::filled(1.0, 0, 3); } catch (const InvalidConfiguration&) { caught++; }

    if (caught != 8) {
        std::cout << "FAIL: " << caught << "/8 errors raised" << std::endl;
        return false;
    }
    // A rejected update leaves the parameters untouched
    if (layer.weights() != make_layer().weights()) {
        std::cout << "FAIL: failed update modified weights" << std::endl;
        return false;
    }
    std::cout << "PASS" << std::endl;
    return true;
}

bool check_initialization() {
    std::cout << "[Test] Dense Initialization..." << std::endl;

    Dense<double> a = Dense<double>::seeded(2, 6, 42);
    Dense<double> b = Dense<double>::seeded(2, 6, 42);
    if (a.weights() != b.weights() || a.bias() != b.bias()) {
        std::cout << "FAIL: same seed produced different parameters" << std::endl;
        return false;
    }
    if (a.weight_count() != 12 || a.neuron_count() != 6 || a.bias().size() != 6) {
        std::cout << "FAIL: wrong parameter shapes" << std::endl;
        return false;
    }
    for (double w : a.weights()) {
        if (w < -1.0 || w >= 1.0) {
            std::cout << "FAIL: weight " << w << " outside [-1, 1)" << std::endl;
            return false;
        }
    }

    // Neurons must not start out identical
    bool all_equal = true;
    for (size_t i = 0; i < 2; ++i) {
        if (a.weight(0, i) != a.weight(1, i)) all_equal = false;
    }
    if (all_equal) {
        std::cout << "FAIL: first two neurons share weights" << std::endl;
        return false;
    }

    std::mt19937 gen(7);
    Dense<double> x = Dense<double>::normal(4, 4, gen);
    for (double v : x.bias()) {
        if (v != 0.0) {
            std::cout << "FAIL: Xavier init bias not zero" << std::endl;
            return false;
        }
    }

    Dense<double> f = Dense<double>::filled(0.5, 3, 2);
    for (double v : f.weights()) {
        if (v != 0.5) {
            std::cout << "FAIL: filled weight " << v << std::endl;
            return false;
        }
    }

    // Unseeded construction only needs the right shape
    Dense<double> r = Dense<double>::random(3, 5);
    if (r.input_count() != 3 || r.output_count() != 5 || r.weight_count() != 15) {
        std::cout << "FAIL: random layer has wrong shape" << std::endl;
        return false;
    }
    std::cout << "PASS" << std::endl;
    return true;
}

int main() {
    bool ok = true;
    ok &= check_output();
    ok &= check_zero_input_returns_bias();
    ok &= check_input_gradient();
    ok &= check_update();
    ok &= check_shape_errors();
    ok &= check_initialization();

    if (!ok) {
        std::cerr << "Dense tests FAILED" << std::endl;
        return 1;
    }
    std::cout << "All Dense tests passed!" << std::endl;
    return 0;
}
