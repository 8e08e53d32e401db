/**
 * @file analysis_case.cpp
 * @brief Analysis case loading and evaluation
 */

#include <compfail/io/analysis_case.hpp>
#include <compfail/core/logger.hpp>

namespace cfl {
namespace io {

using physics::BoxSection;
using physics::GeometryCheck;
using physics::SectionLoads;
using physics::StressState;
using physics::failure::TransverseStrengths;
using physics::failure::TsaiWuCriterion;
using physics::failure::TsaiWuStrengths;

namespace {

TsaiWuStrengths read_strengths(const ConfigSection& mat) {
    TsaiWuStrengths s;
    s.Xc = mat.require_real("Xc");
    s.Xt = mat.require_real("Xt");
    s.Zc = mat.require_real("Zc");
    s.Zt = mat.require_real("Zt");
    s.Sxy = mat.require_real("Sxy");
    s.Syz = mat.require_real("Syz");
    s.transverse = TransverseStrengths::from_optional(mat.find_real("Yc"),
                                                      mat.find_real("Yt"),
                                                      mat.find_real("Sxz"));
    s.validate();
    return s;
}

GeometryCheck read_geometry_check(const ConfigSection& sec) {
    const std::string mode = sec.get_string("geometry_check", "strict");
    if (mode == "strict") return GeometryCheck::Strict;
    if (mode == "legacy") return GeometryCheck::Legacy;
    throw InvalidArgumentError("Unknown geometry_check '" + mode + "' (expected strict or legacy)");
}

BoxSection read_section(const ConfigSection& sec, GeometryCheck check) {
    BoxSection section{sec.require_real("height"),
                       sec.require_real("width"),
                       sec.require_real("wall_thickness")};
    section.validate(check);
    if (!section.is_thin_walled()) {
        CFL_LOG_WARN("Section h={} b={} t={}: walls overlap (2t={}), properties are not physical",
                     section.height, section.width, section.wall_thickness,
                     2.0*section.wall_thickness);
    }
    return section;
}

std::string item_name(const ConfigSection& item, const char* prefix, std::size_t index) {
    return item.get_string("name", std::string(prefix) + "_" + std::to_string(index));
}

} // namespace

AnalysisCase load_analysis_case(const ConfigSection& root) {
    AnalysisCase analysis;

    const ConfigSection& mat = root.subsection("material");
    analysis.material_name = mat.get_string("name", "material");
    analysis.strengths = read_strengths(mat);

    if (root.has_subsection("section")) {
        const ConfigSection& sec = root.subsection("section");
        analysis.geometry_check = read_geometry_check(sec);
        analysis.section = read_section(sec, analysis.geometry_check);
    }

    if (root.has_subsection("load_cases")) {
        if (!analysis.section) {
            throw InvalidArgumentError("load_cases given without a 'section' entry");
        }
        const auto items = root.subsection("load_cases").list_items();
        for (std::size_t i = 0; i < items.size(); ++i) {
            const ConfigSection& item = *items[i];
            LoadCase lc;
            lc.name = item_name(item, "load_case", i);
            lc.loads.bending_moment = item.get_real("bending_moment", 0.0);
            lc.loads.profile_torque = item.get_real("profile_torque", 0.0);
            lc.loads.shear_force = item.get_real("shear_force", 0.0);
            lc.loads.tailboom_torque = item.get_real("tailboom_torque", 0.0);
            analysis.load_cases.push_back(lc);
        }
    }

    if (root.has_subsection("stress_states")) {
        const auto items = root.subsection("stress_states").list_items();
        for (std::size_t i = 0; i < items.size(); ++i) {
            const ConfigSection& item = *items[i];
            std::vector<Real> values = item.get_real_array("stress");
            if (values.size() != 6) {
                throw InvalidArgumentError(
                    "stress_states[" + std::to_string(i) +
                    "]: 'stress' must hold 6 numbers [x, y, z, xy, xz, yz]");
            }
            StressCase sc;
            sc.name = item_name(item, "stress_state", i);
            sc.stress = StressState{values[0], values[1], values[2],
                                    values[3], values[4], values[5]};
            analysis.stress_cases.push_back(sc);
        }
    }

    if (analysis.load_cases.empty() && analysis.stress_cases.empty()) {
        CFL_LOG_WARN("Analysis case for '{}' defines no load cases or stress states",
                     analysis.material_name);
    }

    CFL_LOG_INFO("Material '{}': {} load case(s), {} stress state(s)",
                 analysis.material_name, analysis.load_cases.size(),
                 analysis.stress_cases.size());
    return analysis;
}

AnalysisCase load_analysis_case_file(const std::string& filename) {
    ConfigReader reader;
    return load_analysis_case(reader.read(filename));
}

std::vector<CaseOutcome> run_analysis_case(const AnalysisCase& analysis) {
    CFL_REQUIRE(analysis.load_cases.empty() || analysis.section.has_value(),
                "load cases need a box section");

    TsaiWuCriterion criterion(analysis.strengths);

    std::vector<CaseOutcome> outcomes;
    outcomes.reserve(analysis.load_cases.size() + analysis.stress_cases.size());

    for (const auto& lc : analysis.load_cases) {
        StressState stress = physics::section_stress(*analysis.section, lc.loads,
                                                     analysis.geometry_check);
        outcomes.push_back({lc.name, stress, criterion.evaluate(stress)});
    }
    for (const auto& sc : analysis.stress_cases) {
        outcomes.push_back({sc.name, sc.stress, criterion.evaluate(sc.stress)});
    }

    return outcomes;
}

} // namespace io
} // namespace cfl
