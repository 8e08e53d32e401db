/**
 * @file tsai_wu_test.cpp
 * @brief Tests for the Tsai-Wu criterion and safety factor
 */

#include <compfail/compfail.hpp>
#include <iostream>
#include <cmath>
#include <algorithm>
#include <string>
#include <limits>

using namespace cfl;
using namespace cfl::physics;
using namespace cfl::physics::failure;

static int tests_passed = 0;
static int tests_failed = 0;

#define CHECK(cond, msg) do { \
    if (cond) { \
        std::cout << "[PASS] " << msg << "\n"; \
        tests_passed++; \
    } else { \
        std::cout << "[FAIL] " << msg << "\n"; \
        tests_failed++; \
    } \
} while(0)

static bool near_rel(double value, double expected, double rel) {
    return std::abs(value - expected) <= rel * std::max(std::abs(value), std::abs(expected));
}

// Carbon/epoxy spar cap used throughout
static TsaiWuCriterion reference_material() {
    return TsaiWuCriterion(4.206e8, 5.629e8, 1.444e8, 4.938e7, 4.81e7, 2.203e6);
}

static TsaiWuCriterion orthotropic_material() {
    return TsaiWuCriterion(4.206e8, 5.629e8, 1.444e8, 4.938e7, 4.81e7, 2.203e6,
                           TransverseStrengths{2.0e8, 5.0e7, 7.0e7});
}

template<typename Fn>
static bool throws_invalid_argument(Fn&& fn) {
    try {
        fn();
    } catch (const InvalidArgumentError&) {
        return true;
    }
    return false;
}

// ==========================================================================
// Test 1: Coefficients of a transversely isotropic material
// ==========================================================================
void test_coefficients_transversely_isotropic() {
    std::cout << "\n=== Test 1: Coefficients (transversely isotropic) ===\n";

    const double Xc = 4.206e8, Xt = 5.629e8, Zc = 1.444e8, Zt = 4.938e7;
    const double Sxy = 4.81e7, Syz = 2.203e6;

    TsaiWuCriterion tw = reference_material();
    const TsaiWuCoefficients& c = tw.coefficients();

    CHECK(tw.is_transversely_isotropic(), "No axis-2 group: transversely isotropic");
    CHECK(near_rel(c.F11, 1.0/(Xc*Xt), 1e-14), "F11 = 1/(Xc*Xt)");
    CHECK(near_rel(c.F33, 1.0/(Zc*Zt), 1e-14), "F33 = 1/(Zc*Zt)");
    CHECK(near_rel(c.F1, (Xc - Xt)/(Xc*Xt), 1e-14), "F1 = (Xc-Xt)/(Xc*Xt)");
    CHECK(near_rel(c.F3, (Zc - Zt)/(Zc*Zt), 1e-14), "F3 = (Zc-Zt)/(Zc*Zt)");
    CHECK(near_rel(c.F66, 1.0/(Sxy*Sxy), 1e-14), "F66 = 1/Sxy^2");
    CHECK(near_rel(c.F44, 1.0/(Syz*Syz), 1e-14), "F44 = 1/Syz^2");

    CHECK(c.F2 == c.F1, "F2 == F1 exactly");
    CHECK(c.F22 == c.F11, "F22 == F11 exactly");
    CHECK(c.F55 == c.F44, "F55 == F44 exactly");
    CHECK(c.F1 < 0.0, "F1 negative when Xt > Xc");

    const double r66 = std::sqrt(c.F66);
    const double r44 = std::sqrt(c.F44);
    const double F12 = 4.0*r66 - (2.0*c.F1*r66 + 2.0*c.F2*r66 + c.F11 + c.F22 + c.F66);
    const double F23 = 4.0*r44 - (2.0*c.F2*r44 + 2.0*c.F3*r44 + c.F22 + c.F33 + c.F44);
    CHECK(near_rel(c.F12, F12, 1e-12), "F12 closed form");
    CHECK(near_rel(c.F23, F23, 1e-12), "F23 closed form");
    CHECK(near_rel(c.F13, c.F23, 1e-12), "F13 == F23 when axis 2 mirrors axis 1");
    CHECK(c.F12 != -1.0 && c.F13 != -1.0, "Interaction terms are not the -1 convention");
}

// ==========================================================================
// Test 2: Coefficients of an orthotropic material
// ==========================================================================
void test_coefficients_orthotropic() {
    std::cout << "\n=== Test 2: Coefficients (orthotropic) ===\n";

    const double Yc = 2.0e8, Yt = 5.0e7, Sxz = 7.0e7;

    TsaiWuCriterion tw = orthotropic_material();
    const TsaiWuCoefficients& c = tw.coefficients();

    CHECK(!tw.is_transversely_isotropic(), "Axis-2 group given: orthotropic");
    CHECK(near_rel(c.F2, (Yc - Yt)/(Yc*Yt), 1e-14), "F2 = (Yc-Yt)/(Yc*Yt)");
    CHECK(near_rel(c.F22, 1.0/(Yc*Yt), 1e-14), "F22 = 1/(Yc*Yt)");
    CHECK(near_rel(c.F55, 1.0/(Sxz*Sxz), 1e-14), "F55 = 1/Sxz^2");
    CHECK(c.F2 != c.F1, "F2 differs from F1");

    const double r55 = std::sqrt(c.F55);
    const double F13 = 4.0*r55 - (2.0*c.F1*r55 + 2.0*c.F3*r55 + c.F11 + c.F33 + c.F55);
    CHECK(near_rel(c.F13, F13, 1e-12), "F13 uses F55");

    // Same result through the strengths struct
    TsaiWuStrengths s{4.206e8, 5.629e8, 1.444e8, 4.938e7, 4.81e7, 2.203e6,
                      TransverseStrengths{Yc, Yt, Sxz}};
    TsaiWuCriterion tw2(s);
    CHECK(tw2.coefficients().F12 == c.F12, "Struct and scalar constructors agree");
}

// ==========================================================================
// Test 3: Strength validation
// ==========================================================================
void test_validation() {
    std::cout << "\n=== Test 3: Strength validation ===\n";

    CHECK(throws_invalid_argument([] {
        TsaiWuCriterion(0.0, 5.629e8, 1.444e8, 4.938e7, 4.81e7, 2.203e6);
    }), "Zero Xc rejected");

    CHECK(throws_invalid_argument([] {
        TsaiWuCriterion(4.206e8, 5.629e8, 1.444e8, 4.938e7, 4.81e7, std::nan(""));
    }), "NaN Syz rejected");

    CHECK(throws_invalid_argument([] {
        TsaiWuCriterion(4.206e8, 5.629e8, 1.444e8, 4.938e7, 4.81e7, 2.203e6,
                        TransverseStrengths{0.0, 5.0e7, 7.0e7});
    }), "Zero Yc in the axis-2 group rejected");

    CHECK(throws_invalid_argument([] {
        TransverseStrengths::from_optional(2.0e8, 5.0e7, std::nullopt);
    }), "Partial axis-2 group rejected");

    CHECK(throws_invalid_argument([] {
        TransverseStrengths::from_optional(std::nullopt, std::nullopt, 7.0e7);
    }), "Lone Sxz rejected");

    auto none = TransverseStrengths::from_optional(std::nullopt, std::nullopt, std::nullopt);
    CHECK(!none.has_value(), "Absent axis-2 group gives nullopt");

    auto all = TransverseStrengths::from_optional(2.0e8, 5.0e7, 7.0e7);
    CHECK(all.has_value() && all->Yt == 5.0e7, "Complete axis-2 group accepted");

    TsaiWuCriterion tw = reference_material();
    StressState bad;
    bad.x = std::numeric_limits<double>::infinity();
    CHECK(throws_invalid_argument([&] { (void)tw.evaluate(bad); }),
          "Infinite stress component rejected");
}

// ==========================================================================
// Test 4: x/y symmetry of a transversely isotropic material
// ==========================================================================
void test_symmetry() {
    std::cout << "\n=== Test 4: x/y symmetry ===\n";

    TsaiWuCriterion tw = reference_material();

    StressState a;
    a.x = 1.5e8;
    a.y = -4.0e7;
    StressState b;
    b.x = -4.0e7;
    b.y = 1.5e8;

    const double Ra = tw.evaluate(a).failure_index;
    const double Rb = tw.evaluate(b).failure_index;
    std::cout << "R(a,b) = " << Ra << ", R(b,a) = " << Rb << "\n";
    CHECK(near_rel(Ra, Rb, 1e-12), "R(x=a, y=b) == R(x=b, y=a)");

    TsaiWuCriterion ortho = orthotropic_material();
    CHECK(std::abs(ortho.evaluate(a).failure_index - ortho.evaluate(b).failure_index) > 1.0,
          "Orthotropic material is not symmetric");
}

// ==========================================================================
// Test 5: Unloaded state
// ==========================================================================
void test_zero_stress() {
    std::cout << "\n=== Test 5: Zero stress state ===\n";

    TsaiWuCriterion tw = reference_material();
    TsaiWuResult r = tw.evaluate(StressState{});

    CHECK(r.failure_index == 0.0, "R = 0");
    CHECK(!r.fails, "Does not fail");
    CHECK(r.quadratic_term == 0.0 && r.linear_term == 0.0, "A = B = 0");
    CHECK(r.safety_status == SafetyFactorStatus::ZeroQuadraticTerm, "Status: zero quadratic term");
    CHECK(!r.has_safety_factor(), "No safety factor");
    CHECK(std::isnan(r.safety_factor), "Safety factor is NaN");

    std::string report = format_report(r);
    std::cout << report << "\n";
    CHECK(report.find("Material does not fail") == 0, "Report starts with the verdict");
    CHECK(report.find("undefined (zero quadratic term)") != std::string::npos,
          "Report names the degenerate case");
}

// ==========================================================================
// Test 6: Wing root regression
// ==========================================================================
void test_wing_root_regression() {
    std::cout << "\n=== Test 6: Wing root regression ===\n";

    TsaiWuCriterion tw = reference_material();
    StressState s = section_stress(0.02, 0.002, 0.0012, 100.0, 0.0, -1000.0, 0.0,
                                   GeometryCheck::Legacy);
    TsaiWuResult r = tw.evaluate(s);

    std::cout << format_report(r) << "\n";
    CHECK(near_rel(r.failure_index, 3450.6868787017415, 1e-9), "R = 3450.68687870");
    CHECK(r.fails, "Material fails");
    CHECK(r.has_safety_factor(), "Safety factor defined");
    CHECK(near_rel(r.safety_factor, 0.6372299517963627, 1e-9), "k = 0.637229951796");
    CHECK(near_rel(r.quadratic_term, 1.8401217910170928, 1e-9), "A = 1.84012179");
    CHECK(near_rel(r.linear_term, 0.39671149085791796, 1e-9), "B = 0.39671149");

    std::string report = format_report(r);
    CHECK(report.find("Material fails, R = 3450.68") == 0, "Report verdict and R");
    CHECK(report.find("safety factor = 0.63722995") != std::string::npos, "Report safety factor");
}

// ==========================================================================
// Test 7: Uniaxial scaling law
// ==========================================================================
void test_uniaxial_scaling() {
    std::cout << "\n=== Test 7: Uniaxial scaling law ===\n";

    TsaiWuCriterion tw = reference_material();

    struct Case { const char* name; StressState s; double strength; };
    const Case cases[] = {
        {"axis-1 tension",     {1.0e8, 0, 0, 0, 0, 0},  5.629e8},
        {"axis-1 compression", {-2.0e8, 0, 0, 0, 0, 0}, 4.206e8},
        {"axis-2 tension",     {0, 3.0e8, 0, 0, 0, 0},  5.629e8},
        {"axis-3 tension",     {0, 0, 1.0e7, 0, 0, 0},  4.938e7},
        {"axis-3 compression", {0, 0, -1.0e8, 0, 0, 0}, 1.444e8},
    };

    for (const auto& c : cases) {
        TsaiWuResult r = tw.evaluate(c.s);
        const double k = r.safety_factor;
        const double R_scaled = tw.failure_index(c.s.scaled(k));
        std::cout << c.name << ": k = " << k << ", R(k*s) = " << R_scaled << "\n";

        CHECK(r.has_safety_factor(), std::string(c.name) + ": safety factor defined");
        CHECK(near_rel(R_scaled, 1.0, 1e-9), std::string(c.name) + ": R(k*s) == 1");

        const double magnitude = std::abs(c.s.x + c.s.y + c.s.z);
        CHECK(near_rel(k*magnitude, c.strength, 1e-9),
              std::string(c.name) + ": k*|s| equals the strength");
    }

    // Below the strength: no failure and k > 1
    TsaiWuResult safe = tw.evaluate({1.0e8, 0, 0, 0, 0, 0});
    CHECK(!safe.fails && safe.safety_factor > 1.0, "Below Xt: safe, k > 1");

    TsaiWuResult over = tw.evaluate({1.01*5.629e8, 0, 0, 0, 0, 0});
    CHECK(over.fails && over.safety_factor < 1.0, "Above Xt: fails, k < 1");

    TsaiWuCriterion ortho = orthotropic_material();
    TsaiWuResult ry = ortho.evaluate({0, 1.0e7, 0, 0, 0, 0});
    CHECK(near_rel(ry.safety_factor*1.0e7, 5.0e7, 1e-9), "Orthotropic axis-2 tension reaches Yt");
}

// ==========================================================================
// Test 8: Degenerate safety factor solve
// ==========================================================================
void test_degenerate_solve() {
    std::cout << "\n=== Test 8: Degenerate safety factor ===\n";

    double k = 0.0;
    CHECK(TsaiWuCriterion::solve_safety_factor(1.0, 0.0, k) == SafetyFactorStatus::Defined
          && k == 1.0, "A=1, B=0: k = 1");
    CHECK(TsaiWuCriterion::solve_safety_factor(0.0, 2.0, k) == SafetyFactorStatus::ZeroQuadraticTerm
          && std::isnan(k), "A=0: zero quadratic term");
    CHECK(TsaiWuCriterion::solve_safety_factor(-1.0, 0.0, k) == SafetyFactorStatus::NegativeDiscriminant
          && std::isnan(k), "A=-1, B=0: negative discriminant");

    // B*B overflows: the discriminant is +inf and so is the root
    k = 0.0;
    CHECK(TsaiWuCriterion::solve_safety_factor(1.0e200, 1.0e200, k) == SafetyFactorStatus::NonFinite
          && std::isnan(k), "Overflowing root: non-finite");
    // B*B = +inf and 4A = -inf: the discriminant is NaN
    k = 0.0;
    CHECK(TsaiWuCriterion::solve_safety_factor(-1.0e308, 1.0e200, k) == SafetyFactorStatus::NonFinite
          && std::isnan(k), "NaN discriminant: non-finite");

    // Equal biaxial tension: the subtracted F12 term makes A strongly negative
    TsaiWuCriterion tw = reference_material();
    TsaiWuResult r = tw.evaluate({1.0e6, 1.0e6, 0, 0, 0, 0});
    CHECK(r.quadratic_term < 0.0, "Biaxial tension: A < 0");
    CHECK(r.safety_status == SafetyFactorStatus::NegativeDiscriminant,
          "Biaxial tension: negative discriminant reported");
    CHECK(format_report(r).find("undefined (negative discriminant)") != std::string::npos,
          "Report names the negative discriminant");

    CHECK(std::string(to_string(SafetyFactorStatus::Defined)) == "defined"
          && std::string(to_string(SafetyFactorStatus::ZeroQuadraticTerm)) == "zero quadratic term"
          && std::string(to_string(SafetyFactorStatus::NegativeDiscriminant)) == "negative discriminant"
          && std::string(to_string(SafetyFactorStatus::NonFinite)) == "non-finite root",
          "Every status has a name");
}

// ==========================================================================
// Test 9: Shear enters A linearly
// ==========================================================================
void test_shear_terms() {
    std::cout << "\n=== Test 9: Shear terms ===\n";

    TsaiWuCriterion tw = reference_material();
    const TsaiWuCoefficients& c = tw.coefficients();

    StressState s;
    s.yz = 1.0e6;
    TsaiWuResult r = tw.evaluate(s);

    CHECK(near_rel(r.failure_index, c.F44*1.0e12, 1e-12), "R uses yz^2");
    CHECK(near_rel(r.quadratic_term, c.F44*1.0e6, 1e-12), "A uses yz linearly");
    CHECK(r.linear_term == 0.0, "B ignores shear");
    CHECK(near_rel(r.safety_factor, 1.0/std::sqrt(r.quadratic_term), 1e-12),
          "Pure shear: k = 1/sqrt(A)");
}

// ==========================================================================
// Test 10: Report chaining
// ==========================================================================
void test_report_chaining() {
    std::cout << "\n=== Test 10: Report chaining ===\n";

    TsaiWuCriterion tw = reference_material();
    const TsaiWuCriterion& back = tw.report({1.0e8, 0, 0, 0, 0, 0})
                                    .report({0, 0, 0, 1.0e7, 0, 0});
    CHECK(&back == &tw, "report() returns the same criterion");
}

// ==========================================================================
// Main
// ==========================================================================
int main() {
    InitOptions options;
    options.log_level = Logger::Level::Warn;
    options.print_banner = false;
    Context context(options);

    std::cout << "========================================\n";
    std::cout << "CompFail: Tsai-Wu Criterion Test\n";
    std::cout << "========================================\n";

    test_coefficients_transversely_isotropic();
    test_coefficients_orthotropic();
    test_validation();
    test_symmetry();
    test_zero_stress();
    test_wing_root_regression();
    test_uniaxial_scaling();
    test_degenerate_solve();
    test_shear_terms();
    test_report_chaining();

    std::cout << "\n========================================\n";
    std::cout << "Results: " << tests_passed << "/" << (tests_passed + tests_failed)
              << " tests passed\n";
    std::cout << "========================================\n";

    return (tests_failed > 0) ? 1 : 0;
}
