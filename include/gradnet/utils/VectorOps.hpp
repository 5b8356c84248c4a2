#ifndef GRADNET_UTILS_VECTOROPS_HPP
#define GRADNET_UTILS_VECTOROPS_HPP

#include "../core/Errors.hpp"
#include "../core/Vector.hpp"

namespace gradnet {
namespace utils {

// Sum of all elements.
template <typename T>
T sum(const Vector<T>& v) {
    T result = 0;
    for (T val : v) result += val;
    return result;
}

// Element-wise product and sum of two vectors of equal length.
template <typename T>
T dot(const T* x, const T* y, size_t n) {
    T result = 0;
    for (size_t i = 0; i < n; ++i) {
        result += x[i] * y[i];
    }
    return result;
}

template <typename T>
T dot(const Vector<T>& x, const Vector<T>& y) {
    detail::check_size("dot", "rhs", x.size(), y.size());
    return dot(x.data(), y.data(), x.size());
}

template <typename T>
Vector<T> add(const Vector<T>& x, const Vector<T>& y) {
    detail::check_size("add", "rhs", x.size(), y.size());
    Vector<T> result(x.size());
    size_t n = x.size();
    GRADNET_SIMD_LOOP
    for (size_t i = 0; i < n; ++i) {
        result[i] = x[i] + y[i];
    }
    return result;
}

template <typename T>
Vector<T> add_scalar(const Vector<T>& x, T y) {
    Vector<T> result(x);
    for (auto& a : result) a += y;
    return result;
}

// x += y, in place.
template <typename T>
void add_mut(Vector<T>& x, const Vector<T>& y) {
    detail::check_size("add_mut", "rhs", x.size(), y.size());
    size_t n = x.size();
    GRADNET_SIMD_LOOP
    for (size_t i = 0; i < n; ++i) {
        x[i] += y[i];
    }
}

// x += a * y, in place. Raw pointer version used by the dense update.
template <typename T>
void axpy_mut(T* x, T a, const T* y, size_t n) {
    GRADNET_SIMD_LOOP
    for (size_t i = 0; i < n; ++i) {
        x[i] += a * y[i];
    }
}

template <typename T>
void axpy_mut(Vector<T>& x, T a, const Vector<T>& y) {
    detail::check_size("axpy_mut", "rhs", x.size(), y.size());
    axpy_mut(x.data(), a, y.data(), x.size());
}

// Element-wise (Hadamard) product.
template <typename T>
Vector<T> product(const Vector<T>& x, const Vector<T>& y) {
    detail::check_size("product", "rhs", x.size(), y.size());
    Vector<T> result(x.size());
    size_t n = x.size();
    GRADNET_SIMD_LOOP
    for (size_t i = 0; i < n; ++i) {
        result[i] = x[i] * y[i];
    }
    return result;
}

template <typename T>
void product_mut(Vector<T>& x, const Vector<T>& y) {
    detail::check_size("product_mut", "rhs", x.size(), y.size());
    size_t n = x.size();
    GRADNET_SIMD_LOOP
    for (size_t i = 0; i < n; ++i) {
        x[i] *= y[i];
    }
}

} // namespace utils
} // namespace gradnet

#endif // GRADNET_UTILS_VECTOROPS_HPP
