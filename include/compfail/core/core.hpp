#pragma once

// Core infrastructure headers
#include <compfail/core/types.hpp>
#include <compfail/core/exception.hpp>
#include <compfail/core/logger.hpp>

#include <string>

namespace cfl {

// ============================================================================
// Version Information
// ============================================================================

namespace version {

inline constexpr int major = 0;
inline constexpr int minor = 1;
inline constexpr int patch = 0;

inline constexpr const char* string = "0.1.0";
inline constexpr const char* build_date = __DATE__;

} // namespace version

// ============================================================================
// Initialization and Finalization
// ============================================================================

struct InitOptions {
    Logger::Level log_level = Logger::Level::Info;
    bool log_to_console = true;
    bool log_to_file = false;
    std::string log_file = "compfail.log";
    bool print_banner = true;
};

inline void initialize(const InitOptions& options = InitOptions{}) {
    if (options.log_to_console && options.log_to_file) {
        Logger::instance().init_combined(options.log_file, options.log_level);
    } else if (options.log_to_file) {
        Logger::instance().init_file(options.log_file, options.log_level);
    } else {
        Logger::instance().init_console(options.log_level);
    }

    if (options.print_banner) {
        CFL_LOG_INFO("=================================================");
        CFL_LOG_INFO("CompFail v{} (built {})", version::string, version::build_date);
        CFL_LOG_INFO("=================================================");
    }
}

inline void finalize() {
    CFL_LOG_DEBUG("CompFail shutting down");
    Logger::instance().flush();
}

// ============================================================================
// RAII Wrapper for Initialization/Finalization
// ============================================================================

class Context {
public:
    explicit Context(const InitOptions& options = InitOptions{}) {
        initialize(options);
    }

    ~Context() {
        finalize();
    }

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
    Context(Context&&) = delete;
    Context& operator=(Context&&) = delete;
};

} // namespace cfl
