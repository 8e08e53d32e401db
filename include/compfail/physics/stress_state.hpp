#pragma once

/**
 * @file stress_state.hpp
 * @brief Six-component stress state in material axes
 */

#include <compfail/core/types.hpp>
#include <cmath>

namespace cfl {
namespace physics {

/**
 * @brief Cauchy stress components in the material frame
 *
 * Normal components are positive in tension. Member order matches the
 * argument order of the failure criteria: x, y, z, xy, xz, yz.
 */
struct StressState {
    Real x  = 0.0;   ///< Normal stress along axis 1
    Real y  = 0.0;   ///< Normal stress along axis 2
    Real z  = 0.0;   ///< Normal stress along axis 3
    Real xy = 0.0;   ///< Shear stress in the 1-2 plane
    Real xz = 0.0;   ///< Shear stress in the 1-3 plane
    Real yz = 0.0;   ///< Shear stress in the 2-3 plane

    StressState scaled(Real factor) const {
        return {factor * x, factor * y, factor * z,
                factor * xy, factor * xz, factor * yz};
    }

    bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z)
            && std::isfinite(xy) && std::isfinite(xz) && std::isfinite(yz);
    }
};

} // namespace physics
} // namespace cfl
