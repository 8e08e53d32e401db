#pragma once

/**
 * @file analysis_case.hpp
 * @brief Material, section and load cases read from a configuration file
 *
 * Layout:
 * ```
 * material:
 *   name: "cfrp_spar_cap"
 *   Xc: 4.206e8
 *   Xt: 5.629e8
 *   Zc: 1.444e8
 *   Zt: 4.938e7
 *   Sxy: 4.81e7
 *   Syz: 2.203e6
 *   # Yc, Yt, Sxz: optional, all three or none
 *
 * section:
 *   height: 20.0e-3
 *   width: 2.0e-3
 *   wall_thickness: 1.2e-3
 *   geometry_check: "strict"   # or "legacy"
 *
 * load_cases:
 *   - name: "root"
 *     bending_moment: 100.0
 *     profile_torque: 0.0
 *     shear_force: -1000.0
 *     tailboom_torque: 0.0
 *
 * stress_states:
 *   - name: "uniaxial"
 *     stress: [1.0e8, 0, 0, 0, 0, 0]
 * ```
 */

#include <compfail/io/config_reader.hpp>
#include <compfail/physics/failure/tsai_wu.hpp>
#include <compfail/physics/section.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cfl {
namespace io {

struct LoadCase {
    std::string name;
    physics::SectionLoads loads;
};

struct StressCase {
    std::string name;
    physics::StressState stress;
};

struct AnalysisCase {
    std::string material_name;
    physics::failure::TsaiWuStrengths strengths;
    std::optional<physics::BoxSection> section;
    physics::GeometryCheck geometry_check = physics::GeometryCheck::Strict;
    std::vector<LoadCase> load_cases;
    std::vector<StressCase> stress_cases;
};

struct CaseOutcome {
    std::string name;
    physics::StressState stress;
    physics::failure::TsaiWuResult result;
};

/**
 * @brief Build an analysis case from a parsed configuration
 * @throws InvalidArgumentError on missing or inconsistent entries
 */
AnalysisCase load_analysis_case(const ConfigSection& root);

/**
 * @brief Read and build an analysis case from a file
 * @throws FileIOError if the file cannot be opened
 */
AnalysisCase load_analysis_case_file(const std::string& filename);

/**
 * @brief Evaluate all load cases, then all direct stress cases
 */
std::vector<CaseOutcome> run_analysis_case(const AnalysisCase& analysis);

} // namespace io
} // namespace cfl
