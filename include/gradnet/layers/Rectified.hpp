#ifndef GRADNET_LAYERS_RECTIFIED_HPP
#define GRADNET_LAYERS_RECTIFIED_HPP

#include "Activation.hpp"
#include <string>

namespace gradnet {
namespace layers {

template <typename T>
class Rectified : public Activation<Rectified<T>, T> {
public:
    explicit Rectified(size_t size) : Activation<Rectified<T>, T>(size) {}

    static T activate(T x) { return x > 0 ? x : 0; }

    // dy/dx = 1 if x > 0 else 0
    static T derivative(T x, T /*y*/) { return x > 0 ? 1 : 0; }

    std::string name() const { return "Rectified"; }
};

} // namespace layers
} // namespace gradnet

#endif // GRADNET_LAYERS_RECTIFIED_HPP
