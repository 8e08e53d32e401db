#pragma once

/**
 * @file compfail.hpp
 * @brief Main header for the CompFail library
 *
 * Include this single header to get access to all CompFail functionality.
 */

// Core infrastructure
#include <compfail/core/core.hpp>

// Physics
#include <compfail/physics/stress_state.hpp>
#include <compfail/physics/section.hpp>
#include <compfail/physics/failure/tsai_wu.hpp>

// Input
#include <compfail/io/config_reader.hpp>
#include <compfail/io/analysis_case.hpp>
