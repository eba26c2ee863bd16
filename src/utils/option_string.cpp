#include "utils/option_string.hpp"

namespace cloudvm {
namespace utils {

std::string assemble(const std::string& separator,
                     const std::vector<OptionEntry>& entries) {
    std::string result;
    bool first = true;

    for (const auto& entry : entries) {
        if (entry.value.empty()) continue;

        if (!first) {
            result += separator;
        }
        first = false;

        if (entry.key.empty()) {
            result += entry.value;
        } else {
            result += entry.key + "=" + entry.value;
        }
    }

    return result;
}

std::string prefixed(const std::string& flag, const std::string& assembled) {
    if (assembled.empty()) {
        return "";
    }
    return flag + assembled;
}

} // namespace utils
} // namespace cloudvm
