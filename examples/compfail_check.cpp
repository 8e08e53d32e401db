/**
 * @file compfail_check.cpp
 * @brief Tsai-Wu check of a box-section wing spar
 *
 * Usage:
 *   compfail_check                 run the built-in wing root case
 *   compfail_check case.yaml       run every case of a configuration file
 *
 * Exit code: 0 on success (whatever the verdicts), 1 on error.
 */

#include <compfail/compfail.hpp>
#include <iostream>

using namespace cfl;
using namespace cfl::physics;
using namespace cfl::physics::failure;

namespace {

void run_builtin_case() {
    // Carbon/epoxy spar cap, transversely isotropic
    TsaiWuCriterion criterion(4.206e8, 5.629e8, 1.444e8, 4.938e7, 4.81e7, 2.203e6);
    criterion.print_summary();

    // 20 x 2 mm box, 1.2 mm wall, 100 N*m bending and 1 kN shear at the wing root.
    // The walls overlap across the width, so only the legacy geometry check passes.
    BoxSection section{20e-3, 2e-3, 1.2e-3};
    if (!section.is_thin_walled()) {
        CFL_LOG_WARN("Section h={} b={} t={}: walls overlap, legacy geometry check",
                     section.height, section.width, section.wall_thickness);
    }
    SectionLoads loads{100000e-3, 0.0, -1000.0, 0.0};
    StressState stress = section_stress(section, loads, GeometryCheck::Legacy);
    CFL_LOG_INFO("Section stress: X = {:.6e} Pa, YZ = {:.6e} Pa", stress.x, stress.yz);

    TsaiWuResult result = criterion.evaluate(stress);
    std::cout << format_report(result) << "\n";
}

void run_config(const std::string& filename) {
    io::AnalysisCase analysis = io::load_analysis_case_file(filename);
    TsaiWuCriterion(analysis.strengths).print_summary();

    for (const auto& outcome : io::run_analysis_case(analysis)) {
        std::cout << "[" << outcome.name << "] " << format_report(outcome.result) << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    InitOptions options;
    options.log_level = Logger::Level::Info;
    Context context(options);

    try {
        if (argc > 1) {
            run_config(argv[1]);
        } else {
            run_builtin_case();
        }
    } catch (const Exception& e) {
        CFL_LOG_ERROR("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        CFL_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }

    return 0;
}
