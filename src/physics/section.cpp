/**
 * @file section.cpp
 * @brief Box section properties and stress recovery
 */

#include <compfail/physics/section.hpp>
#include <compfail/core/exception.hpp>
#include <compfail/core/logger.hpp>
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace cfl {
namespace physics {

const char* to_string(GeometryCheck check) {
    switch (check) {
        case GeometryCheck::Strict: return "strict";
        case GeometryCheck::Legacy: return "legacy";
    }
    return "unknown";
}

void BoxSection::validate(GeometryCheck check) const {
    const Real h = height;
    const Real b = width;
    const Real t = wall_thickness;

    if (!(std::isfinite(h) && std::isfinite(b) && std::isfinite(t))) {
        throw InvalidArgumentError(
            fmt::format("Box section dimensions must be finite (h={}, b={}, t={})", h, b, t));
    }
    if (h <= 0.0 || b <= 0.0 || t <= 0.0) {
        throw InvalidArgumentError(
            fmt::format("Box section dimensions must be positive (h={}, b={}, t={})", h, b, t));
    }
    if (check == GeometryCheck::Strict && !is_thin_walled()) {
        throw InvalidArgumentError(
            fmt::format("Box section wall too thick: 2t={} must be below h={} and b={}",
                        2.0*t, h, b));
    }
}

BoxSectionProperties compute_box_properties(const BoxSection& section, GeometryCheck check) {
    section.validate(check);

    const Real h = section.height;
    const Real b = section.width;
    const Real t = section.wall_thickness;
    const Real hi = h - 2.0*t;
    const Real bi = b - 2.0*t;

    BoxSectionProperties p;
    p.area = h*b - hi*bi;
    p.Ix = b*h*h*h/12.0 - bi*hi*hi*hi/12.0;
    p.Iy = h*b*b*b/12.0 - hi*bi*bi*bi/12.0;
    p.J = p.Ix + p.Iy;
    p.Q = p.area * h/2.0;

    if (!(p.Ix > 0.0 && p.Iy > 0.0 && p.J > 0.0)) {
        throw InvalidArgumentError(
            fmt::format("Box section h={} b={} t={} has non-positive second moments "
                        "(Ix={}, Iy={}, J={})", h, b, t, p.Ix, p.Iy, p.J));
    }
    return p;
}

StressState section_stress(const BoxSection& section, const SectionLoads& loads,
                           GeometryCheck check) {
    if (!(std::isfinite(loads.bending_moment) && std::isfinite(loads.profile_torque)
          && std::isfinite(loads.shear_force) && std::isfinite(loads.tailboom_torque))) {
        throw InvalidArgumentError(
            fmt::format("Section loads must be finite (MF={}, MTp={}, FC={}, MTt={})",
                        loads.bending_moment, loads.profile_torque,
                        loads.shear_force, loads.tailboom_torque));
    }

    const BoxSectionProperties p = compute_box_properties(section, check);
    const Real half_h = section.height/2.0;
    const Real t = section.wall_thickness;

    StressState s;
    s.x = -(loads.bending_moment*half_h/p.Ix);
    // Magnitudes are summed, so the three contributions never cancel
    s.yz = std::abs(loads.tailboom_torque*half_h/p.J)
         + std::abs(loads.profile_torque*half_h/p.J)
         + std::abs(loads.shear_force*p.Q/(p.Ix*2.0*t));

    CFL_LOG_DEBUG("Box section h={} b={} t={}: Ix={:.6e} J={:.6e} Q={:.6e} -> X={:.6e} YZ={:.6e}",
                  section.height, section.width, t, p.Ix, p.J, p.Q, s.x, s.yz);
    return s;
}

StressState section_stress(Real h, Real b, Real t,
                           Real MF, Real MTp, Real FC, Real MTt,
                           GeometryCheck check) {
    return section_stress(BoxSection{h, b, t}, SectionLoads{MF, MTp, FC, MTt}, check);
}

} // namespace physics
} // namespace cfl
