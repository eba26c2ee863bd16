#include "config/config.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace cloudvm {

using json = nlohmann::json;

std::string backend_name(Backend backend) {
    switch (backend) {
        case Backend::Libvirt: return "libvirt";
        case Backend::Virsh: return "virsh";
    }
    return "unknown";
}

std::optional<Backend> backend_from_string(const std::string& s) {
    if (s == "libvirt") return Backend::Libvirt;
    if (s == "virsh") return Backend::Virsh;
    return std::nullopt;
}

Config Config::defaults(const std::string& home, const std::string& user) {
    Config config;
    config.home_dir = home;
    config.image_dir = home + "/virt/images";
    config.vm_dir = home + "/virt/vms";
    config.additional_user = user;

    // First key that exists wins; validation reports a missing default key
    const char* candidates[] = {"id_ed25519.pub", "id_rsa.pub", "id_dsa.pub"};
    config.ssh_public_key = home + "/.ssh/id_rsa.pub";
    for (const char* candidate : candidates) {
        std::string path = home + "/.ssh/" + candidate;
        std::error_code ec;
        if (fs::exists(path, ec)) {
            config.ssh_public_key = path;
            break;
        }
    }

    return config;
}

Config Config::defaults() {
    std::string home;
    std::string user;

    const char* home_env = getenv("HOME");
    const char* user_env = getenv("USER");
    struct passwd* pw = getpwuid(getuid());

    if (home_env && *home_env) {
        home = home_env;
    } else if (pw) {
        home = pw->pw_dir;
    } else {
        home = "/root";
    }

    if (user_env && *user_env) {
        user = user_env;
    } else if (pw) {
        user = pw->pw_name;
    } else {
        user = "cloud";
    }

    return defaults(home, user);
}

void Config::apply(const ConfigOverrides& o) {
    if (o.image_dir) image_dir = config::expand_home(*o.image_dir, home_dir);
    if (o.vm_dir) vm_dir = config::expand_home(*o.vm_dir, home_dir);
    if (o.bridge) bridge = *o.bridge;
    if (o.vcpus) vcpus = *o.vcpus;
    if (o.memory_mb) memory_mb = *o.memory_mb;
    if (o.disk_size_gb) disk_size_gb = *o.disk_size_gb;
    if (o.dns_domain) dns_domain = *o.dns_domain;
    if (o.distro) distro = *o.distro;
    if (o.ssh_public_key) ssh_public_key = config::expand_home(*o.ssh_public_key, home_dir);
    if (o.timezone) timezone = *o.timezone;
    if (o.additional_user) additional_user = *o.additional_user;
    if (o.graphics) graphics = *o.graphics;
    if (o.cpu_model) cpu_model = *o.cpu_model;
    if (o.autostart) autostart = *o.autostart;
    if (o.connect_uri) connect_uri = *o.connect_uri;
    if (o.backend) backend = *o.backend;
    if (o.ip_wait_timeout) ip_wait_timeout = *o.ip_wait_timeout;
    if (o.ip_poll_interval) ip_poll_interval = *o.ip_poll_interval;
    if (o.disk_options) disk_options = *o.disk_options;
    if (o.network_options) network_options = *o.network_options;
}

std::string Config::vm_path(const std::string& name) const {
    return vm_dir + "/" + name;
}

namespace config {

std::string default_file_path(const std::string& home) {
    const char* env = getenv("CLOUDVM_CONFIG");
    if (env && *env) {
        return env;
    }
    return home + "/.cloudvmrc";
}

std::string expand_home(const std::string& path, const std::string& home) {
    if (path == "~") {
        return home;
    }
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        return home + path.substr(1);
    }
    return path;
}

ConfigOverrides load_file(const std::string& path) {
    ConfigOverrides o;

    std::ifstream file(path);
    if (!file) {
        std::error_code ec;
        if (fs::exists(path, ec)) {
            throw ValidationError("Cannot read config file " + path);
        }
        return o;
    }

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ValidationError("Malformed config file " + path + ": " + e.what());
    }

    if (!doc.is_object()) {
        throw ValidationError("Config file " + path + " must hold a JSON object");
    }

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();

        try {
            if (key == "image_dir") o.image_dir = value.get<std::string>();
            else if (key == "vm_dir") o.vm_dir = value.get<std::string>();
            else if (key == "bridge") o.bridge = value.get<std::string>();
            else if (key == "vcpus") o.vcpus = value.get<int>();
            else if (key == "memory_mb") o.memory_mb = value.get<int>();
            else if (key == "disk_size_gb") o.disk_size_gb = value.get<int>();
            else if (key == "dns_domain") o.dns_domain = value.get<std::string>();
            else if (key == "distro") o.distro = value.get<std::string>();
            else if (key == "ssh_public_key") o.ssh_public_key = value.get<std::string>();
            else if (key == "timezone") o.timezone = value.get<std::string>();
            else if (key == "additional_user") o.additional_user = value.get<std::string>();
            else if (key == "graphics") o.graphics = value.get<std::string>();
            else if (key == "cpu_model") o.cpu_model = value.get<std::string>();
            else if (key == "autostart") o.autostart = value.get<bool>();
            else if (key == "connect_uri") o.connect_uri = value.get<std::string>();
            else if (key == "ip_wait_timeout") o.ip_wait_timeout = value.get<int>();
            else if (key == "ip_poll_interval") o.ip_poll_interval = value.get<int>();
            else if (key == "disk_options") o.disk_options = value.get<std::string>();
            else if (key == "network_options") o.network_options = value.get<std::string>();
            else if (key == "backend") {
                auto backend = backend_from_string(value.get<std::string>());
                if (!backend) {
                    throw ValidationError("Config file " + path + ": key 'backend' must be "
                                          "\"libvirt\" or \"virsh\"");
                }
                o.backend = *backend;
            } else {
                CLOUDVM_LOG_WARN("Ignoring unknown key '{}' in {}", key, path);
            }
        } catch (const json::type_error& e) {
            throw ValidationError("Config file " + path + ": key '" + key +
                                  "' has the wrong type (" + e.what() + ")");
        }
    }

    CLOUDVM_LOG_DEBUG("Loaded overrides from {}", path);
    return o;
}

} // namespace config
} // namespace cloudvm
