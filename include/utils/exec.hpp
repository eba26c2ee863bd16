#pragma once

#include <functional>
#include <string>
#include <vector>

namespace cloudvm {
namespace utils {

/**
 * ExecResult - Result of executing a command
 */
struct ExecResult {
    int exit_code = -1;
    std::string stdout_output;
    std::string stderr_output;

    bool ok() const { return exit_code == 0; }
};

/**
 * CommandRunner - Signature shared by exec() and the test doubles that
 * providers accept in its place
 */
using CommandRunner = std::function<ExecResult(const std::string&,
                                               const std::vector<std::string>&)>;

/**
 * Execute a command and capture output
 *
 * The command is run directly (no shell). Exit code 127 means the binary
 * could not be executed.
 *
 * @param command Command to execute, looked up in PATH
 * @param args Arguments (not including command itself)
 * @return ExecResult with exit code and output
 */
ExecResult exec(const std::string& command,
                const std::vector<std::string>& args);

/**
 * Render a command line for logs and error messages
 */
std::string format_command(const std::string& command,
                           const std::vector<std::string>& args);

} // namespace utils
} // namespace cloudvm
