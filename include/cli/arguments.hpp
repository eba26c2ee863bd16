#pragma once

#include "config/config.hpp"
#include "provision/lifecycle.hpp"
#include "provision/workflow.hpp"
#include <string>
#include <vector>

namespace cloudvm {
namespace cli {

/**
 * CreateOptions - Parsed `create` command line
 */
struct CreateOptions {
    std::string name;
    ConfigOverrides overrides;
    std::string custom_image_path;
    std::string custom_script_path;
    std::string mac_address;
    OverwritePolicy overwrite = OverwritePolicy::Prompt;
    bool verbose = false;
};

/**
 * RemoveOptions - Parsed `remove` command line
 */
struct RemoveOptions {
    std::string name;
    bool verbose = false;
};

/**
 * AttachDiskOptions - Parsed `attach-disk` command line
 */
struct AttachDiskOptions {
    AttachDiskRequest request;
    bool verbose = false;
};

/**
 * Parse arguments following `create`
 * @throws UsageError on unknown flags, missing values, bad numbers,
 *         both overwrite flags, or a positional count other than one
 */
CreateOptions parse_create(const std::vector<std::string>& args);

/**
 * Parse arguments following `remove`
 * @throws UsageError
 */
RemoveOptions parse_remove(const std::vector<std::string>& args);

/**
 * Parse arguments following `attach-disk`
 * @throws UsageError if target or size is missing
 */
AttachDiskOptions parse_attach_disk(const std::vector<std::string>& args);

} // namespace cli
} // namespace cloudvm
