#pragma once

#include <stdexcept>
#include <string>

namespace cloudvm {

/// Process exit codes
namespace exit_codes {
constexpr int ok = 0;
constexpr int usage = 1;
constexpr int failure = 2;
} // namespace exit_codes

/// Base class for errors that end a cloudvm command
class Error : public std::runtime_error {
public:
    Error(const std::string& msg, int exit_code)
        : std::runtime_error(msg), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

/// Bad or missing flags, wrong positional argument count
class UsageError : public Error {
public:
    explicit UsageError(const std::string& msg)
        : Error(msg, exit_codes::usage) {}
};

/// Input that is well-formed but cannot be acted on
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& msg)
        : Error(msg, exit_codes::failure) {}
};

/// A hypervisor call or external tool failed
class ExternalToolError : public Error {
public:
    ExternalToolError(const std::string& step, const std::string& detail)
        : Error(detail.empty() ? step : step + ": " + detail,
                exit_codes::failure) {}
};

} // namespace cloudvm
