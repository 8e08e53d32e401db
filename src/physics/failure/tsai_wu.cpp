/**
 * @file tsai_wu.cpp
 * @brief Tsai-Wu coefficient derivation and safety factor solve
 */

#include <compfail/physics/failure/tsai_wu.hpp>
#include <compfail/core/exception.hpp>
#include <compfail/core/logger.hpp>
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace cfl {
namespace physics {
namespace failure {

namespace {

void require_strength(Real value, const char* name) {
    if (!std::isfinite(value) || value == 0.0) {
        throw InvalidArgumentError(
            fmt::format("Strength {} must be finite and nonzero (got {})", name, value));
    }
}

} // namespace

// ============================================================================
// Strength Parameters
// ============================================================================

std::optional<TransverseStrengths> TransverseStrengths::from_optional(std::optional<Real> Yc,
                                                                      std::optional<Real> Yt,
                                                                      std::optional<Real> Sxz) {
    const int given = int(Yc.has_value()) + int(Yt.has_value()) + int(Sxz.has_value());
    if (given == 0) {
        return std::nullopt;
    }
    if (given != 3) {
        throw InvalidArgumentError(
            fmt::format("Yc, Yt and Sxz must be given together or not at all "
                        "(Yc {}, Yt {}, Sxz {})",
                        Yc ? "given" : "missing",
                        Yt ? "given" : "missing",
                        Sxz ? "given" : "missing"));
    }
    return TransverseStrengths{*Yc, *Yt, *Sxz};
}

void TsaiWuStrengths::validate() const {
    require_strength(Xc, "Xc");
    require_strength(Xt, "Xt");
    require_strength(Zc, "Zc");
    require_strength(Zt, "Zt");
    require_strength(Sxy, "Sxy");
    require_strength(Syz, "Syz");
    if (transverse) {
        require_strength(transverse->Yc, "Yc");
        require_strength(transverse->Yt, "Yt");
        require_strength(transverse->Sxz, "Sxz");
    }
}

// ============================================================================
// Result Formatting
// ============================================================================

const char* to_string(SafetyFactorStatus status) {
    switch (status) {
        case SafetyFactorStatus::Defined: return "defined";
        case SafetyFactorStatus::ZeroQuadraticTerm: return "zero quadratic term";
        case SafetyFactorStatus::NegativeDiscriminant: return "negative discriminant";
        case SafetyFactorStatus::NonFinite: return "non-finite root";
    }
    return "unknown";
}

std::string format_report(const TsaiWuResult& result) {
    const char* verdict = result.fails ? "Material fails" : "Material does not fail";
    if (result.has_safety_factor()) {
        return fmt::format("{}, R = {}, safety factor = {}",
                           verdict, result.failure_index, result.safety_factor);
    }
    return fmt::format("{}, R = {}, safety factor = undefined ({})",
                       verdict, result.failure_index, to_string(result.safety_status));
}

// ============================================================================
// Tsai-Wu Criterion
// ============================================================================

TsaiWuCriterion::TsaiWuCriterion(const TsaiWuStrengths& strengths)
    : strengths_(strengths)
    , coeffs_(compute_coefficients(strengths))
{}

TsaiWuCriterion::TsaiWuCriterion(Real Xc, Real Xt, Real Zc, Real Zt, Real Sxy, Real Syz,
                                 std::optional<TransverseStrengths> transverse)
    : TsaiWuCriterion(TsaiWuStrengths{Xc, Xt, Zc, Zt, Sxy, Syz, transverse})
{}

TsaiWuCoefficients TsaiWuCriterion::compute_coefficients(const TsaiWuStrengths& s) {
    s.validate();

    TsaiWuCoefficients c;

    // Computed in this order
    c.F11 = 1.0 / (s.Xc * s.Xt);
    c.F33 = 1.0 / (s.Zc * s.Zt);
    c.F1  = (s.Xc - s.Xt) / (s.Xc * s.Xt);
    c.F3  = (s.Zc - s.Zt) / (s.Zc * s.Zt);
    c.F66 = 1.0 / (s.Sxy * s.Sxy);
    c.F44 = 1.0 / (s.Syz * s.Syz);

    if (s.transverse) {
        const TransverseStrengths& t = *s.transverse;
        c.F2  = (t.Yc - t.Yt) / (t.Yc * t.Yt);
        c.F22 = 1.0 / (t.Yc * t.Yt);
        c.F55 = 1.0 / (t.Sxz * t.Sxz);
    } else {
        // Transversely isotropic
        c.F2  = c.F1;
        c.F22 = c.F11;
        c.F55 = c.F44;
    }

    // F44, F55, F66 are reciprocals of squares, so the roots are real
    const Real r66 = std::sqrt(c.F66);
    const Real r55 = std::sqrt(c.F55);
    const Real r44 = std::sqrt(c.F44);

    c.F12 = 4.0*r66 - (2.0*c.F1*r66 + 2.0*c.F2*r66 + c.F11 + c.F22 + c.F66);
    c.F13 = 4.0*r55 - (2.0*c.F1*r55 + 2.0*c.F3*r55 + c.F11 + c.F33 + c.F55);
    c.F23 = 4.0*r44 - (2.0*c.F2*r44 + 2.0*c.F3*r44 + c.F22 + c.F33 + c.F44);

    return c;
}

Real TsaiWuCriterion::failure_index(const StressState& s) const {
    const TsaiWuCoefficients& c = coeffs_;
    return c.F1*s.x + c.F2*s.y + c.F3*s.z
         + c.F11*s.x*s.x + c.F22*s.y*s.y + c.F33*s.z*s.z
         + c.F44*s.yz*s.yz + c.F55*s.xz*s.xz + c.F66*s.xy*s.xy
         + 2.0*c.F12*s.x*s.y + 2.0*c.F13*s.x*s.z + 2.0*c.F23*s.y*s.z;
}

SafetyFactorStatus TsaiWuCriterion::solve_safety_factor(Real A, Real B, Real& k) {
    k = constants::quiet_nan<Real>;

    if (A == 0.0) {
        return SafetyFactorStatus::ZeroQuadraticTerm;
    }

    const Real discriminant = B*B + 4.0*A;
    if (std::isnan(discriminant)) {
        return SafetyFactorStatus::NonFinite;
    }
    if (discriminant < 0.0) {
        return SafetyFactorStatus::NegativeDiscriminant;
    }

    const Real root = (std::sqrt(discriminant) - B) / (2.0*A);
    if (!std::isfinite(root)) {
        return SafetyFactorStatus::NonFinite;
    }

    k = root;
    return SafetyFactorStatus::Defined;
}

TsaiWuResult TsaiWuCriterion::evaluate(const StressState& s) const {
    if (!s.is_finite()) {
        throw InvalidArgumentError(
            fmt::format("Stress components must be finite (x={}, y={}, z={}, xy={}, xz={}, yz={})",
                        s.x, s.y, s.z, s.xy, s.xz, s.yz));
    }

    const TsaiWuCoefficients& c = coeffs_;

    TsaiWuResult result;
    result.failure_index = failure_index(s);
    result.fails = std::abs(result.failure_index) >= 1.0;

    // Shear enters A linearly and the interaction terms are subtracted
    result.quadratic_term = c.F11*s.x*s.x + c.F22*s.y*s.y + c.F33*s.z*s.z
                          + c.F44*s.yz + c.F55*s.xz + c.F66*s.xy
                          - c.F12*s.x*s.y - c.F13*s.x*s.z - c.F23*s.y*s.z;
    result.linear_term = c.F1*s.x + c.F2*s.y + c.F3*s.z;

    result.safety_status = solve_safety_factor(result.quadratic_term,
                                               result.linear_term,
                                               result.safety_factor);

    CFL_LOG_DEBUG("Tsai-Wu: R={:.6e} A={:.6e} B={:.6e} k={:.6e}",
                  result.failure_index, result.quadratic_term,
                  result.linear_term, result.safety_factor);

    if (!result.has_safety_factor()) {
        CFL_LOG_WARN("Tsai-Wu safety factor undefined: {} (A={}, B={})",
                     to_string(result.safety_status),
                     result.quadratic_term, result.linear_term);
    }

    return result;
}

const TsaiWuCriterion& TsaiWuCriterion::report(const StressState& s) const {
    CFL_LOG_INFO("{}", format_report(evaluate(s)));
    return *this;
}

void TsaiWuCriterion::print_summary() const {
    const TsaiWuStrengths& s = strengths_;
    const TsaiWuCoefficients& c = coeffs_;

    CFL_LOG_INFO("Tsai-Wu criterion ({})",
                 is_transversely_isotropic() ? "transversely isotropic" : "orthotropic");
    CFL_LOG_INFO("  Xc={:.4e} Xt={:.4e} Zc={:.4e} Zt={:.4e} Sxy={:.4e} Syz={:.4e}",
                 s.Xc, s.Xt, s.Zc, s.Zt, s.Sxy, s.Syz);
    if (s.transverse) {
        CFL_LOG_INFO("  Yc={:.4e} Yt={:.4e} Sxz={:.4e}",
                     s.transverse->Yc, s.transverse->Yt, s.transverse->Sxz);
    }
    CFL_LOG_INFO("  F1={:.6e}  F2={:.6e}  F3={:.6e}", c.F1, c.F2, c.F3);
    CFL_LOG_INFO("  F11={:.6e} F22={:.6e} F33={:.6e}", c.F11, c.F22, c.F33);
    CFL_LOG_INFO("  F44={:.6e} F55={:.6e} F66={:.6e}", c.F44, c.F55, c.F66);
    CFL_LOG_INFO("  F12={:.6e} F13={:.6e} F23={:.6e}", c.F12, c.F13, c.F23);
}

} // namespace failure
} // namespace physics
} // namespace cfl
