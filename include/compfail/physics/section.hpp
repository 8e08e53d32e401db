#pragma once

/**
 * @file section.hpp
 * @brief Thin-walled hollow rectangular (box) beam section
 *
 * Converts internal beam loads at a section into the stress components
 * used by the composite failure criteria. Only the dominant load path is
 * modelled: bending normal stress on axis 1 and a combined shear stress
 * in the yz plane. All other components are zero.
 */

#include <compfail/core/types.hpp>
#include <compfail/physics/stress_state.hpp>

namespace cfl {
namespace physics {

// ============================================================================
// Section Geometry and Loads
// ============================================================================

/**
 * @brief How strictly the wall thickness is checked against the outer size
 */
enum class GeometryCheck {
    Strict,  ///< Require 2t < h and 2t < b
    Legacy   ///< Allow overlapping walls as long as Ix, Iy and J stay positive
};

const char* to_string(GeometryCheck check);

struct BoxSection {
    Real height;            ///< Outer height h
    Real width;             ///< Outer width b
    Real wall_thickness;    ///< Wall thickness t

    /// True when 2t < h and 2t < b
    bool is_thin_walled() const {
        return 2.0*wall_thickness < height && 2.0*wall_thickness < width;
    }

    /**
     * @brief Throw InvalidArgumentError unless h, b, t are finite and positive
     *        and, for GeometryCheck::Strict, 2t < h and 2t < b
     */
    void validate(GeometryCheck check = GeometryCheck::Strict) const;
};

struct SectionLoads {
    Real bending_moment = 0.0;    ///< MF, spanwise lift distribution outboard of the section
    Real profile_torque = 0.0;    ///< MTp, pitching moment of the airfoil profile
    Real shear_force = 0.0;       ///< FC, lift carried through the section
    Real tailboom_torque = 0.0;   ///< MTt, torque introduced by the tail surfaces
};

// ============================================================================
// Section Properties
// ============================================================================

struct BoxSectionProperties {
    Real area;   ///< Wall area h*b - (h-2t)*(b-2t)
    Real Ix;     ///< Second moment about the bending axis
    Real Iy;     ///< Second moment about the other axis
    Real J;      ///< Torsion constant, approximated as Ix + Iy
    Real Q;      ///< First moment of area for the shear stress, area*h/2
};

/**
 * @throws InvalidArgumentError if the section is invalid for @p check, or if
 *         Ix, Iy or J is not positive
 */
BoxSectionProperties compute_box_properties(const BoxSection& section,
                                            GeometryCheck check = GeometryCheck::Strict);

// ============================================================================
// Section Stress
// ============================================================================

/**
 * @brief Stress state at the section
 *
 *   X  = -(MF*(h/2)/Ix)
 *   YZ = |MTt*(h/2)/J| + |MTp*(h/2)/J| + |FC*Q/(Ix*2t)|
 *
 * @return {X, 0, 0, 0, 0, YZ}
 */
StressState section_stress(const BoxSection& section, const SectionLoads& loads,
                           GeometryCheck check = GeometryCheck::Strict);

StressState section_stress(Real h, Real b, Real t,
                           Real MF, Real MTp, Real FC, Real MTt,
                           GeometryCheck check = GeometryCheck::Strict);

} // namespace physics
} // namespace cfl
