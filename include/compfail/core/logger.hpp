#pragma once

#include <memory>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace cfl {

// ============================================================================
// Logger Class
// ============================================================================

class Logger {
public:
    enum class Level {
        Trace = SPDLOG_LEVEL_TRACE,
        Debug = SPDLOG_LEVEL_DEBUG,
        Info = SPDLOG_LEVEL_INFO,
        Warn = SPDLOG_LEVEL_WARN,
        Error = SPDLOG_LEVEL_ERROR,
        Critical = SPDLOG_LEVEL_CRITICAL,
        Off = SPDLOG_LEVEL_OFF
    };

    // Get the global logger instance (singleton)
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    // Initialize logger with console output
    void init_console(Level level = Level::Info) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog(level));

        install(std::make_shared<spdlog::logger>("cfl", console_sink), level);
    }

    // Initialize logger with file output
    void init_file(const std::string& filename,
                   Level level = Level::Info,
                   size_t max_size = 1024 * 1024 * 10,  // 10MB
                   size_t max_files = 3) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            filename, max_size, max_files
        );
        file_sink->set_level(to_spdlog(level));

        install(std::make_shared<spdlog::logger>("cfl", file_sink), level);
    }

    // Initialize logger with both console and file output
    void init_combined(const std::string& filename,
                       Level console_level = Level::Info,
                       Level file_level = Level::Debug) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog(console_level));

        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename);
        file_sink->set_level(to_spdlog(file_level));

        spdlog::sinks_init_list sink_list = {console_sink, file_sink};
        install(std::make_shared<spdlog::logger>("cfl", sink_list), Level::Trace);  // Sinks filter
    }

    // Log functions
    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->critical(fmt, std::forward<Args>(args)...);
    }

    void flush() {
        if (logger_) logger_->flush();
    }

private:
    Logger() {
        // Default initialization with console
        init_console();
    }

    ~Logger() {
        flush();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    static spdlog::level::level_enum to_spdlog(Level level) {
        return static_cast<spdlog::level::level_enum>(level);
    }

    void install(std::shared_ptr<spdlog::logger> logger, Level level) {
        logger_ = std::move(logger);
        logger_->set_level(to_spdlog(level));

        // Pattern: [timestamp] [level] message
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_default_logger(logger_);
    }

    std::shared_ptr<spdlog::logger> logger_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define CFL_LOG_TRACE(...)    ::cfl::Logger::instance().trace(__VA_ARGS__)
#define CFL_LOG_DEBUG(...)    ::cfl::Logger::instance().debug(__VA_ARGS__)
#define CFL_LOG_INFO(...)     ::cfl::Logger::instance().info(__VA_ARGS__)
#define CFL_LOG_WARN(...)     ::cfl::Logger::instance().warn(__VA_ARGS__)
#define CFL_LOG_ERROR(...)    ::cfl::Logger::instance().error(__VA_ARGS__)
#define CFL_LOG_CRITICAL(...) ::cfl::Logger::instance().critical(__VA_ARGS__)

} // namespace cfl
