#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <sstream>
#include <source_location>

namespace cfl {

using SourceLocation = std::source_location;

// ============================================================================
// Exception Base Class
// ============================================================================

class Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message,
                       const SourceLocation& location = SourceLocation::current())
        : std::runtime_error(format_message(message, location))
        , message_(message)
        , file_(location.file_name())
        , line_(location.line())
        , function_(location.function_name())
    {}

    /// Message without the source location prefix
    const std::string& message() const noexcept { return message_; }

    const char* file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    const char* function() const noexcept { return function_; }

private:
    std::string message_;
    const char* file_;
    int line_;
    const char* function_;

    static std::string format_message(const std::string& msg,
                                        const SourceLocation& loc) {
        std::ostringstream oss;
        oss << loc.file_name() << ":"
            << loc.line() << " in "
            << loc.function_name() << "(): "
            << msg;
        return oss.str();
    }
};

// ============================================================================
// Specific Exception Types
// ============================================================================

class InvalidArgumentError : public Exception {
public:
    explicit InvalidArgumentError(const std::string& message,
                                   const SourceLocation& location = SourceLocation::current())
        : Exception(message, location) {}
};

class FileIOError : public Exception {
public:
    explicit FileIOError(
        const std::string& filename,
        const std::string& operation = "access",
        const SourceLocation& location = SourceLocation::current())
        : Exception("Failed to " + operation + " file: " + filename, location)
    {}
};

// ============================================================================
// Requirement Macro
// ============================================================================

#define CFL_REQUIRE(condition, message) \
    do { \
        if (!(condition)) { \
            throw ::cfl::InvalidArgumentError( \
                std::string("Requirement failed: ") + #condition + ": " + (message) \
            ); \
        } \
    } while (false)

} // namespace cfl
