#include "utils/console.hpp"
#include <unistd.h>

namespace cloudvm {
namespace utils {

// ANSI color codes
namespace colors {
    const char* RED = "\033[0;31m";
    const char* GREEN = "\033[0;32m";
    const char* YELLOW = "\033[1;33m";
    const char* BLUE = "\033[0;34m";
    const char* RESET = "\033[0m";
}

Console::Console(std::ostream& out, std::ostream& err, bool use_colors)
    : out_(out), err_(err), use_colors_(use_colors) {}

Console Console::standard() {
    // Disable colors if not a TTY
    return Console(std::cout, std::cerr, isatty(STDOUT_FILENO) != 0);
}

void Console::emit(std::ostream& os, const char* color, const char* tag,
                   const std::string& msg) const {
    if (use_colors_) {
        os << color << tag << colors::RESET << " " << msg << std::endl;
    } else {
        os << tag << " " << msg << std::endl;
    }
}

void Console::info(const std::string& msg) const {
    emit(out_, colors::BLUE, "[INFO]", msg);
}

void Console::success(const std::string& msg) const {
    emit(out_, colors::GREEN, "[OK]", msg);
}

void Console::warn(const std::string& msg) const {
    emit(out_, colors::YELLOW, "[WARN]", msg);
}

void Console::error(const std::string& msg) const {
    emit(err_, colors::RED, "[ERROR]", msg);
}

std::string Console::ask(const std::string& question, std::istream& in) const {
    if (use_colors_) {
        out_ << colors::YELLOW << "[WARN]" << colors::RESET << " " << question << " ";
    } else {
        out_ << "[WARN] " << question << " ";
    }
    out_.flush();

    std::string answer;
    if (!std::getline(in, answer)) {
        return "";
    }
    return answer;
}

} // namespace utils
} // namespace cloudvm
