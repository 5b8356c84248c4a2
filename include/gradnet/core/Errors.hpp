#ifndef GRADNET_CORE_ERRORS_HPP
#define GRADNET_CORE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace gradnet {

// A vector length does not match the width a layer or network expects.
class ShapeMismatch : public std::invalid_argument {
public:
    explicit ShapeMismatch(const std::string& what) : std::invalid_argument(what) {}
};

// Rejected construction parameters (zero widths, bad learning rate, ...).
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what) : std::invalid_argument(what) {}
};

namespace detail {

inline void check_size(const char* where, const char* what, size_t expected, size_t actual) {
    if (expected != actual) {
        throw ShapeMismatch(std::string(where) + ": " + what + " has length " +
                            std::to_string(actual) + ", expected " + std::to_string(expected));
    }
}

} // namespace detail

} // namespace gradnet

#endif // GRADNET_CORE_ERRORS_HPP
