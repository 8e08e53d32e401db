#pragma once

#include <cstdint>
#include <limits>

namespace cfl {

// ============================================================================
// Precision Types
// ============================================================================

#ifdef COMPFAIL_REAL
using Real = COMPFAIL_REAL;
#else
using Real = double;  // Default to double precision
#endif

using Int = std::int32_t;

// ============================================================================
// Constants
// ============================================================================

namespace constants {

template<typename T = Real>
inline constexpr T quiet_nan = std::numeric_limits<T>::quiet_NaN();

} // namespace constants

} // namespace cfl
