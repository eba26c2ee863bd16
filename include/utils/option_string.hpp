#pragma once

#include <string>
#include <vector>

namespace cloudvm {
namespace utils {

/**
 * OptionEntry - One element of a delimited option string
 *
 * An entry with an empty key is positional and renders as its bare value;
 * otherwise it renders as "key=value".
 */
struct OptionEntry {
    std::string key;
    std::string value;
};

/// Positional entry, e.g. the file path that leads a --disk= string
inline OptionEntry positional(const std::string& value) {
    return OptionEntry{"", value};
}

/**
 * Join option entries with a separator
 *
 * Entries with an empty value are skipped. Order is preserved.
 * @param separator Text placed between rendered entries
 * @param entries Ordered entries
 * @return Joined string, empty when every entry was skipped
 */
std::string assemble(const std::string& separator,
                     const std::vector<OptionEntry>& entries);

/**
 * Prefix an assembled string with its flag ("--network=" + options)
 * @return Empty string when assembled is empty, so the flag can be dropped
 */
std::string prefixed(const std::string& flag, const std::string& assembled);

} // namespace utils
} // namespace cloudvm
