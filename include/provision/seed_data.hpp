#pragma once

#include "catalog/distro_catalog.hpp"
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace cloudvm {

/**
 * SeedInput - Values that go into a VM's cloud-init seed
 */
struct SeedInput {
    std::string hostname;
    std::string dns_domain;
    std::string user;               // additional user with sudo rights
    std::string ssh_public_key;     // key text, not a path
    std::string timezone;
    OsFamily family = OsFamily::Generic;
    std::string custom_script;      // shell script text; empty = none
};

namespace seed {

/// MIME boundary separating the user-data parts
extern const char* const MIME_BOUNDARY;

/**
 * Group that grants sudo on a family ("sudo" or "wheel")
 */
std::string sudo_group(OsFamily family);

/**
 * First-boot commands for a family: restart networking so the new
 * hostname is announced over DHCP, then keep cloud-init from running again
 */
std::vector<std::string> first_boot_commands(OsFamily family);

/**
 * The cloud-config document as a YAML tree
 */
YAML::Node cloud_config(const SeedInput& input);

/**
 * Multipart user-data: the cloud-config part, followed by the custom
 * script part when one is given
 */
std::string user_data(const SeedInput& input);

/**
 * meta-data document (instance-id, local-hostname)
 */
std::string meta_data(const SeedInput& input);

} // namespace seed
} // namespace cloudvm
