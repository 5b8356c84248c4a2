#ifndef GRADNET_LOSS_SQUAREDERROR_HPP
#define GRADNET_LOSS_SQUAREDERROR_HPP

#include "../core/Errors.hpp"
#include "../core/Vector.hpp"

namespace gradnet {
namespace loss {

// Elementwise loss and its derivative w.r.t. the prediction.
// Derived supplies loss1(pred, target) and deriv1(pred, target).
template <typename Derived, typename T>
class Loss {
public:
    Vector<T> loss(const Vector<T>& preds, const Vector<T>& targets) const {
        detail::check_size("Loss::loss", "targets", preds.size(), targets.size());
        Vector<T> result(preds.size());
        for (size_t k = 0; k < preds.size(); ++k) {
            result[k] = derived().loss1(preds[k], targets[k]);
        }
        return result;
    }

    T total(const Vector<T>& preds, const Vector<T>& targets) const {
        detail::check_size("Loss::total", "targets", preds.size(), targets.size());
        T result = 0;
        for (size_t k = 0; k < preds.size(); ++k) {
            result += derived().loss1(preds[k], targets[k]);
        }
        return result;
    }

    Vector<T> gradient(const Vector<T>& preds, const Vector<T>& targets) const {
        detail::check_size("Loss::gradient", "targets", preds.size(), targets.size());
        Vector<T> result(preds.size());
        for (size_t k = 0; k < preds.size(); ++k) {
            result[k] = derived().deriv1(preds[k], targets[k]);
        }
        return result;
    }

private:
    const Derived& derived() const { return static_cast<const Derived&>(*this); }
};

// e = (y - t)^2, de/dy = 2 (y - t)
template <typename T>
class SquaredError : public Loss<SquaredError<T>, T> {
public:
    T loss1(T pred, T target) const { return (pred - target) * (pred - target); }
    T deriv1(T pred, T target) const { return 2 * (pred - target); }
};

// e = (y - t)^2 / 2, de/dy = y - t
template <typename T>
class HalfSquaredError : public Loss<HalfSquaredError<T>, T> {
public:
    T loss1(T pred, T target) const { return T(0.5) * (pred - target) * (pred - target); }
    T deriv1(T pred, T target) const { return pred - target; }
};

} // namespace loss
} // namespace gradnet

#endif // GRADNET_LOSS_SQUAREDERROR_HPP
