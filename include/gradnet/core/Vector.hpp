#ifndef GRADNET_CORE_VECTOR_HPP
#define GRADNET_CORE_VECTOR_HPP

#include <vector>

// Check for OpenMP support
#if defined(_OPENMP)
#include <omp.h>
#define GRADNET_SIMD_LOOP _Pragma("omp simd")
#else
#define GRADNET_SIMD_LOOP
#endif

namespace gradnet {

// The unit of data passed between layers.
template <typename T>
using Vector = std::vector<T>;

} // namespace gradnet

#endif // GRADNET_CORE_VECTOR_HPP
