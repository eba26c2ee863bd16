#pragma once

#include <iostream>
#include <string>

namespace cloudvm {
namespace utils {

/**
 * Console - Short status lines for the operator
 *
 * Informational output goes to `out`, errors to `err`. Colors are only
 * emitted when requested (normally: stdout is a TTY).
 */
class Console {
public:
    Console(std::ostream& out, std::ostream& err, bool use_colors);

    /**
     * Console bound to std::cout/std::cerr, colored when stdout is a TTY
     */
    static Console standard();

    void info(const std::string& msg) const;
    void success(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void error(const std::string& msg) const;

    /// Print a question without newline and read one line of answer
    std::string ask(const std::string& question, std::istream& in) const;

    std::ostream& out() const { return out_; }

private:
    void emit(std::ostream& os, const char* color, const char* tag,
              const std::string& msg) const;

    std::ostream& out_;
    std::ostream& err_;
    bool use_colors_;
};

} // namespace utils
} // namespace cloudvm
