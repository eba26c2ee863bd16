#include "provision/seed_data.hpp"
#include <sstream>

namespace cloudvm {
namespace seed {

const char* const MIME_BOUNDARY = "==BOUNDARY==";

namespace {

std::string chomp(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

std::string emit(const YAML::Node& node) {
    YAML::Emitter out;
    out << node;
    return std::string(out.c_str()) + "\n";
}

}  // anonymous namespace

std::string sudo_group(OsFamily family) {
    switch (family) {
        case OsFamily::Debian:
        case OsFamily::Ubuntu:
            return "sudo";
        default:
            return "wheel";
    }
}

std::vector<std::string> first_boot_commands(OsFamily family) {
    std::vector<std::string> commands;

    switch (family) {
        case OsFamily::Debian:
            commands.push_back("systemctl restart networking");
            break;
        case OsFamily::Ubuntu:
            commands.push_back("netplan apply");
            break;
        case OsFamily::RedHat:
            commands.push_back("systemctl restart NetworkManager");
            break;
        case OsFamily::RedHatLegacy:
            commands.push_back("service network restart");
            break;
        case OsFamily::Suse:
            commands.push_back("systemctl restart wicked");
            break;
        case OsFamily::Generic:
            break;
    }

    commands.push_back("touch /etc/cloud/cloud-init.disabled");
    if (family == OsFamily::RedHatLegacy) {
        commands.push_back("chkconfig cloud-init off || systemctl disable cloud-init.service");
    }
    return commands;
}

YAML::Node cloud_config(const SeedInput& input) {
    std::string key = chomp(input.ssh_public_key);

    YAML::Node config;
    config["preserve_hostname"] = false;
    config["hostname"] = input.hostname;
    config["fqdn"] = input.dns_domain.empty() ? input.hostname
                                              : input.hostname + "." + input.dns_domain;

    YAML::Node user;
    user["name"] = input.user;
    user["groups"].push_back(sudo_group(input.family));
    user["shell"] = "/bin/bash";
    user["sudo"] = "ALL=(ALL) NOPASSWD:ALL";
    user["ssh_authorized_keys"].push_back(key);

    config["users"].push_back("default");
    config["users"].push_back(user);

    config["output"]["all"] = ">> /var/log/cloud-init.log";

    config["ssh_genkeytypes"].push_back("ed25519");
    config["ssh_genkeytypes"].push_back("rsa");
    config["ssh_authorized_keys"].push_back(key);

    config["timezone"] = input.timezone;

    for (const auto& command : first_boot_commands(input.family)) {
        config["runcmd"].push_back(command);
    }

    return config;
}

std::string user_data(const SeedInput& input) {
    std::ostringstream ss;
    ss << "Content-Type: multipart/mixed; boundary=\"" << MIME_BOUNDARY << "\"\n"
       << "MIME-Version: 1.0\n"
       << "\n"
       << "--" << MIME_BOUNDARY << "\n"
       << "Content-Type: text/cloud-config; charset=\"us-ascii\"\n"
       << "MIME-Version: 1.0\n"
       << "Content-Transfer-Encoding: 7bit\n"
       << "Content-Disposition: attachment; filename=\"cloud-config.yaml\"\n"
       << "\n"
       << "#cloud-config\n"
       << emit(cloud_config(input))
       << "\n";

    if (!input.custom_script.empty()) {
        ss << "--" << MIME_BOUNDARY << "\n"
           << "Content-Type: text/x-shellscript; charset=\"us-ascii\"\n"
           << "MIME-Version: 1.0\n"
           << "Content-Transfer-Encoding: 7bit\n"
           << "Content-Disposition: attachment; filename=\"custom-script.sh\"\n"
           << "\n"
           << input.custom_script;
        if (input.custom_script.back() != '\n') {
            ss << "\n";
        }
        ss << "\n";
    }

    ss << "--" << MIME_BOUNDARY << "--\n";
    return ss.str();
}

std::string meta_data(const SeedInput& input) {
    YAML::Node meta;
    meta["instance-id"] = input.hostname;
    meta["local-hostname"] = input.hostname;
    return emit(meta);
}

} // namespace seed
} // namespace cloudvm
