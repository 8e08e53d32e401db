#pragma once

/**
 * @file tsai_wu.hpp
 * @brief Three-dimensional Tsai-Wu failure criterion with safety factor
 *
 * Failure index:
 *   R = F1*σx + F2*σy + F3*σz
 *     + F11*σx² + F22*σy² + F33*σz²
 *     + F44*τyz² + F55*τxz² + F66*τxy²
 *     + 2*F12*σx*σy + 2*F13*σx*σz + 2*F23*σy*σz
 *
 * The material fails when |R| >= 1.
 *
 * Reference: Daniel & Ishai, "Engineering Mechanics of Composite
 * Materials", Oxford University Press (2006)
 */

#include <compfail/core/types.hpp>
#include <compfail/physics/stress_state.hpp>
#include <optional>
#include <string>

namespace cfl {
namespace physics {
namespace failure {

// ============================================================================
// Strength Parameters
// ============================================================================

/**
 * @brief Axis-2 strengths, supplied as a group or not at all
 */
struct TransverseStrengths {
    Real Yc;    ///< Compressive strength, axis 2
    Real Yt;    ///< Tensile strength, axis 2
    Real Sxz;   ///< Shear strength, 1-3 plane

    /**
     * @brief Build the group from individually optional values
     *
     * Returns std::nullopt when all three are absent and throws
     * InvalidArgumentError when only some of them are given.
     */
    static std::optional<TransverseStrengths> from_optional(std::optional<Real> Yc,
                                                            std::optional<Real> Yt,
                                                            std::optional<Real> Sxz);
};

struct TsaiWuStrengths {
    Real Xc;    ///< Compressive strength, axis 1
    Real Xt;    ///< Tensile strength, axis 1
    Real Zc;    ///< Compressive strength, axis 3
    Real Zt;    ///< Tensile strength, axis 3
    Real Sxy;   ///< Shear strength, 1-2 plane
    Real Syz;   ///< Shear strength, 2-3 plane

    /// Absent for a transversely isotropic material
    std::optional<TransverseStrengths> transverse;

    /**
     * @brief Throw InvalidArgumentError on a zero or non-finite strength
     */
    void validate() const;
};

// ============================================================================
// Strength Tensor Coefficients
// ============================================================================

/**
 * @brief Linear (Fi) and quadratic (Fij) Tsai-Wu coefficients
 *
 * The interaction terms use
 *   F12 = 4*sqrt(F66) - (2*F1*sqrt(F66) + 2*F2*sqrt(F66) + F11 + F22 + F66)
 * and the analogous expressions for F13 (with F55) and F23 (with F44).
 *
 * Some commercial codes set F12 = F13 = F23 = -1 instead. That convention
 * is not used here.
 */
struct TsaiWuCoefficients {
    Real F1, F2, F3;
    Real F11, F22, F33;
    Real F44, F55, F66;
    Real F12, F13, F23;
};

// ============================================================================
// Evaluation Result
// ============================================================================

enum class SafetyFactorStatus {
    Defined,               ///< Safety factor is a finite number
    ZeroQuadraticTerm,     ///< A == 0, includes the unloaded state
    NegativeDiscriminant,  ///< B² + 4A < 0, no real root
    NonFinite              ///< Overflow in the root evaluation
};

const char* to_string(SafetyFactorStatus status);

struct TsaiWuResult {
    Real failure_index = 0.0;      ///< R
    bool fails = false;            ///< |R| >= 1
    Real quadratic_term = 0.0;     ///< A of A*k² + B*k - 1 = 0
    Real linear_term = 0.0;        ///< B of A*k² + B*k - 1 = 0
    Real safety_factor = constants::quiet_nan<Real>;
    SafetyFactorStatus safety_status = SafetyFactorStatus::ZeroQuadraticTerm;

    bool has_safety_factor() const {
        return safety_status == SafetyFactorStatus::Defined;
    }
};

/**
 * @brief One-line report: "Material <fails|does not fail>, R = ..., safety factor = ..."
 */
std::string format_report(const TsaiWuResult& result);

// ============================================================================
// Tsai-Wu Criterion
// ============================================================================

/**
 * @brief Immutable Tsai-Wu criterion for one material
 *
 * Coefficients are computed once at construction. evaluate() only reads
 * them, so one instance can be shared between threads.
 */
class TsaiWuCriterion {
public:
    explicit TsaiWuCriterion(const TsaiWuStrengths& strengths);

    TsaiWuCriterion(Real Xc, Real Xt, Real Zc, Real Zt, Real Sxy, Real Syz,
                    std::optional<TransverseStrengths> transverse = std::nullopt);

    const TsaiWuStrengths& strengths() const { return strengths_; }
    const TsaiWuCoefficients& coefficients() const { return coeffs_; }

    /// True when axis-2 strengths default to the axis-1 values
    bool is_transversely_isotropic() const { return !strengths_.transverse.has_value(); }

    /**
     * @brief Failure index R for a stress state
     */
    Real failure_index(const StressState& s) const;

    /**
     * @brief Failure index, verdict and safety factor
     *
     * The safety factor k solves A*k² + B*k - 1 = 0 with
     *   A = F11*x² + F22*y² + F33*z² + F44*yz + F55*xz + F66*xy
     *       - F12*x*y - F13*x*z - F23*y*z
     *   B = F1*x + F2*y + F3*z
     *   k = (sqrt(B² + 4A) - B) / (2A)
     *
     * A is not the quadratic part of R: shear enters linearly and the
     * interaction terms are subtracted. The two agree only for uniaxial
     * normal stress, so R(k*s) == 1 holds exactly only there.
     *
     * @throws InvalidArgumentError if a stress component is not finite
     */
    TsaiWuResult evaluate(const StressState& s) const;

    /**
     * @brief Evaluate and log the one-line report at info level
     * @return *this, so evaluations can be chained
     */
    const TsaiWuCriterion& report(const StressState& s) const;

    /**
     * @brief Log the strengths and the coefficient table
     */
    void print_summary() const;

    static TsaiWuCoefficients compute_coefficients(const TsaiWuStrengths& strengths);

    /**
     * @brief Positive root of A*k² + B*k - 1 = 0
     * @param k Set to the root, or NaN when the status is not Defined
     */
    static SafetyFactorStatus solve_safety_factor(Real A, Real B, Real& k);

private:
    TsaiWuStrengths strengths_;
    TsaiWuCoefficients coeffs_;
};

} // namespace failure
} // namespace physics
} // namespace cfl
