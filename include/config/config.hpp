#pragma once

#include <optional>
#include <string>

namespace cloudvm {

/**
 * Backend - Which HypervisorProvider implementation drives the hypervisor
 */
enum class Backend {
    Libvirt,    // libvirt C API
    Virsh       // virsh / virt-install subprocesses
};

std::string backend_name(Backend backend);
std::optional<Backend> backend_from_string(const std::string& s);

/**
 * ConfigOverrides - Values supplied by the override file or by flags
 *
 * Unset members leave the corresponding Config value untouched.
 */
struct ConfigOverrides {
    std::optional<std::string> image_dir;
    std::optional<std::string> vm_dir;
    std::optional<std::string> bridge;
    std::optional<int> vcpus;
    std::optional<int> memory_mb;
    std::optional<int> disk_size_gb;
    std::optional<std::string> dns_domain;
    std::optional<std::string> distro;
    std::optional<std::string> ssh_public_key;
    std::optional<std::string> timezone;
    std::optional<std::string> additional_user;
    std::optional<std::string> graphics;
    std::optional<std::string> cpu_model;
    std::optional<bool> autostart;
    std::optional<std::string> connect_uri;
    std::optional<Backend> backend;
    std::optional<int> ip_wait_timeout;
    std::optional<int> ip_poll_interval;
    std::optional<std::string> disk_options;
    std::optional<std::string> network_options;
};

/**
 * Config - Effective settings for one invocation
 *
 * Built as defaults, then the user override file, then command line flags,
 * and passed explicitly from there on.
 */
struct Config {
    std::string home_dir;
    std::string image_dir;
    std::string vm_dir;
    std::string bridge = "virbr0";
    int vcpus = 1;
    int memory_mb = 1024;
    int disk_size_gb = 10;
    std::string dns_domain = "example.local";
    std::string distro = "debian10";
    std::string ssh_public_key;
    std::string timezone = "US/Eastern";
    std::string additional_user;
    std::string graphics = "spice";
    std::string cpu_model = "host-passthrough";
    bool autostart = false;
    std::string connect_uri = "qemu:///system";
    Backend backend = Backend::Libvirt;
    int ip_wait_timeout = 120;     // seconds
    int ip_poll_interval = 1;      // seconds
    std::string disk_options;      // appended to --disk by the virsh backend
    std::string network_options;   // appended to --network by the virsh backend

    /**
     * Hard-coded defaults for a user
     * @param home Home directory used for ~ expansion and default paths
     * @param user Login name, default for the additional guest user
     */
    static Config defaults(const std::string& home, const std::string& user);

    /**
     * Defaults for the invoking user (HOME and USER from the environment)
     */
    static Config defaults();

    /**
     * Apply a set of overrides; path values have ~/ expanded
     */
    void apply(const ConfigOverrides& overrides);

    /// Working directory of a VM: <vm_dir>/<name>
    std::string vm_path(const std::string& name) const;
};

namespace config {

/**
 * Location of the user override file: $CLOUDVM_CONFIG, else ~/.cloudvmrc
 */
std::string default_file_path(const std::string& home);

/**
 * Read an override file
 * @param path JSON file
 * @return Overrides, empty when the file does not exist
 * @throws ValidationError on malformed JSON or a wrongly typed value
 */
ConfigOverrides load_file(const std::string& path);

/**
 * Expand a leading "~/" against home
 */
std::string expand_home(const std::string& path, const std::string& home);

} // namespace config
} // namespace cloudvm
