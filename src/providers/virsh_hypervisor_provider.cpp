#include "providers/virsh_hypervisor_provider.hpp"
#include "catalog/distro_catalog.hpp"
#include "providers/domain_xml.hpp"
#include "utils/logging.hpp"
#include "utils/option_string.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace cloudvm {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::vector<std::string> split_ws(const std::string& line) {
    std::istringstream ss(line);
    std::vector<std::string> tokens;
    std::string token;
    while (ss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

DomainStatus parse_state(const std::string& s) {
    std::string state = trim(s);
    if (state == "running" || state == "idle" || state == "in shutdown") return DomainStatus::Running;
    if (state == "paused") return DomainStatus::Paused;
    if (state == "shut off") return DomainStatus::ShutOff;
    if (state == "crashed") return DomainStatus::Crashed;
    if (state == "pmsuspended") return DomainStatus::Suspended;
    return DomainStatus::Unknown;
}

}  // anonymous namespace

VirshHypervisorProvider::VirshHypervisorProvider(const std::string& uri,
                                                 utils::CommandRunner runner)
    : uri_(uri), runner_(std::move(runner)) {}

utils::ExecResult VirshHypervisorProvider::virsh(const std::vector<std::string>& args) const {
    std::vector<std::string> full = {"--connect", uri_};
    full.insert(full.end(), args.begin(), args.end());

    CLOUDVM_LOG_DEBUG("Running: {}", utils::format_command("virsh", full));
    auto result = runner_("virsh", full);
    CLOUDVM_LOG_DEBUG("virsh exited with {}", result.exit_code);
    if (!result.stdout_output.empty()) {
        CLOUDVM_LOG_DEBUG("stdout: {}", trim(result.stdout_output));
    }
    if (!result.stderr_output.empty()) {
        CLOUDVM_LOG_DEBUG("stderr: {}", trim(result.stderr_output));
    }
    return result;
}

bool VirshHypervisorProvider::virsh_checked(const std::vector<std::string>& args,
                                            std::string* output) {
    auto result = virsh(args);
    if (output) {
        *output = result.stdout_output;
    }
    if (!result.ok()) {
        std::string detail = trim(result.stderr_output);
        last_error_ = "virsh " + (args.empty() ? std::string() : args[0]) + " failed" +
                      (detail.empty() ? "" : ": " + detail);
        return false;
    }
    return true;
}

bool VirshHypervisorProvider::domain_exists(const std::string& name) {
    return virsh({"dominfo", name}).ok();
}

std::vector<std::string> VirshHypervisorProvider::virt_install_args(
    const DomainDefinition& def) const {
    std::vector<std::string> args = {
        "--connect", uri_,
        "--import",
        "--name", def.name,
        "--memory", std::to_string(def.memory_mb),
        "--vcpus", std::to_string(def.vcpus),
        "--cpu", def.cpu_model,
    };

    if (def.os_variant.empty() || def.os_variant == OS_VARIANT_AUTO) {
        args.push_back("--os-variant=detect=on,require=off");
    } else {
        args.push_back("--os-variant=" + def.os_variant);
    }

    for (const auto& disk : def.disks) {
        std::string disk_params = utils::assemble(",", {
            utils::positional(disk.path),
            {"format", disk.format},
            {"bus", disk.bus},
            {"device", disk.cdrom ? "cdrom" : ""},
            {"cache", disk.cache},
            utils::positional(disk.extra_options),
        });
        std::string flag = utils::prefixed("--disk=", disk_params);
        if (!flag.empty()) {
            args.push_back(flag);
        }
    }

    std::string network_params = utils::assemble(",", {
        {"bridge", def.network.bridge},
        {"model", def.network.model},
        {"mac", def.network.mac_address},
        utils::positional(def.network.extra_options),
    });
    std::string network_flag = utils::prefixed("--network=", network_params);
    if (!network_flag.empty()) {
        args.push_back(network_flag);
    }

    args.push_back("--graphics=" + (def.graphics.empty() ? std::string("none") : def.graphics));
    args.push_back("--noautoconsole");
    return args;
}

bool VirshHypervisorProvider::create_domain(const DomainDefinition& definition) {
    auto args = virt_install_args(definition);
    CLOUDVM_LOG_DEBUG("Running: {}", utils::format_command("virt-install", args));

    auto result = runner_("virt-install", args);
    CLOUDVM_LOG_DEBUG("virt-install exited with {}", result.exit_code);
    if (!result.stdout_output.empty()) {
        CLOUDVM_LOG_DEBUG("stdout: {}", trim(result.stdout_output));
    }
    if (!result.stderr_output.empty()) {
        CLOUDVM_LOG_DEBUG("stderr: {}", trim(result.stderr_output));
    }

    if (!result.ok()) {
        std::string detail = trim(result.stderr_output);
        last_error_ = "virt-install failed" + (detail.empty() ? "" : ": " + detail);
        return false;
    }
    return true;
}

bool VirshHypervisorProvider::stop_domain(const std::string& name) {
    std::string state;
    if (!virsh_checked({"domstate", name}, &state)) {
        return false;
    }
    if (parse_state(state) == DomainStatus::ShutOff) {
        return true;
    }

    if (virsh({"destroy", name, "--graceful"}).ok()) {
        return true;
    }
    CLOUDVM_LOG_DEBUG("Graceful stop of {} failed, forcing", name);
    return virsh_checked({"destroy", name});
}

bool VirshHypervisorProvider::undefine_domain(const std::string& name) {
    return virsh_checked({"undefine", name,
                          "--managed-save",
                          "--snapshots-metadata",
                          "--checkpoints-metadata",
                          "--nvram"});
}

bool VirshHypervisorProvider::set_autostart(const std::string& name, bool enabled) {
    if (enabled) {
        return virsh_checked({"autostart", name});
    }
    return virsh_checked({"autostart", name, "--disable"});
}

bool VirshHypervisorProvider::eject_media(const std::string& name, const std::string& target) {
    return virsh_checked({"change-media", name, target, "--eject", "--config"});
}

bool VirshHypervisorProvider::attach_disk(const std::string& name, const DiskDevice& disk) {
    std::vector<std::string> args = {
        "attach-disk", name,
        "--source", disk.path,
        "--target", disk.target,
        "--targetbus", disk.bus,
        "--subdriver", disk.format,
    };
    if (!disk.cache.empty()) {
        args.push_back("--cache");
        args.push_back(disk.cache);
    }
    args.push_back("--persistent");
    return virsh_checked(args);
}

std::optional<DomainInfo> VirshHypervisorProvider::query_domain_info(const std::string& name) {
    std::string xml;
    if (!virsh_checked({"dumpxml", name}, &xml)) {
        return std::nullopt;
    }

    DomainInfo info;
    info.name = name;

    auto mac = domain_xml::find_mac_address(xml);
    if (mac) {
        info.mac_address = *mac;
    }

    std::string state;
    if (virsh_checked({"domstate", name}, &state)) {
        info.status = parse_state(state);
    }

    std::string id;
    if (virsh_checked({"domid", name}, &id)) {
        id = trim(id);
        if (all_digits(id)) {
            info.id = std::stoi(id);
        }
    }

    return info;
}

std::optional<std::vector<DomainInfo>> VirshHypervisorProvider::list_domains() {
    std::string output;
    if (!virsh_checked({"list", "--all"}, &output)) {
        return std::nullopt;
    }

    std::vector<DomainInfo> result;
    std::istringstream ss(output);
    std::string line;
    bool past_header = false;

    while (std::getline(ss, line)) {
        if (!past_header) {
            // Table body starts after the dashed rule
            if (trim(line).rfind("---", 0) == 0) {
                past_header = true;
            }
            continue;
        }

        auto tokens = split_ws(line);
        if (tokens.size() < 3) continue;

        DomainInfo info;
        if (all_digits(tokens[0])) {
            info.id = std::stoi(tokens[0]);
        }
        info.name = tokens[1];

        std::string state;
        for (size_t i = 2; i < tokens.size(); i++) {
            if (!state.empty()) state += " ";
            state += tokens[i];
        }
        info.status = parse_state(state);
        result.push_back(info);
    }

    return result;
}

bool VirshHypervisorProvider::pool_exists(const std::string& name) {
    return virsh({"pool-info", name}).ok();
}

bool VirshHypervisorProvider::create_pool(const std::string& name,
                                          const std::string& target_dir) {
    return virsh_checked({"pool-create-as",
                          "--name", name,
                          "--type", "dir",
                          "--target", target_dir});
}

bool VirshHypervisorProvider::destroy_pool(const std::string& name) {
    std::string info;
    if (!virsh_checked({"pool-info", name}, &info)) {
        return false;
    }

    bool active = false;
    bool persistent = false;
    std::istringstream ss(info);
    std::string line;
    while (std::getline(ss, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = trim(line.substr(0, colon));
        std::string value = trim(line.substr(colon + 1));
        if (key == "State") active = (value == "running");
        if (key == "Persistent") persistent = (value == "yes");
    }

    if (active && !virsh_checked({"pool-destroy", name})) {
        return false;
    }
    if (persistent && !virsh_checked({"pool-undefine", name})) {
        return false;
    }
    return true;
}

std::optional<std::string> VirshHypervisorProvider::network_for_bridge(const std::string& bridge) {
    std::string names;
    if (!virsh_checked({"net-list", "--name"}, &names)) {
        return std::nullopt;
    }

    std::istringstream ss(names);
    std::string network;
    while (std::getline(ss, network)) {
        network = trim(network);
        if (network.empty()) continue;

        std::string info;
        if (!virsh_checked({"net-info", network}, &info)) {
            continue;
        }

        std::istringstream info_ss(info);
        std::string line;
        while (std::getline(info_ss, line)) {
            auto colon = line.find(':');
            if (colon == std::string::npos) continue;
            if (trim(line.substr(0, colon)) == "Bridge" &&
                trim(line.substr(colon + 1)) == bridge) {
                return network;
            }
        }
    }
    return std::nullopt;
}

bool VirshHypervisorProvider::is_managed_bridge(const std::string& bridge) {
    return network_for_bridge(bridge).has_value();
}

std::optional<std::string> VirshHypervisorProvider::lookup_lease(const std::string& bridge,
                                                                 const std::string& mac) {
    auto network = network_for_bridge(bridge);
    if (!network) {
        return std::nullopt;
    }

    std::string wanted = to_lower(mac);
    std::string output;
    if (!virsh_checked({"net-dhcp-leases", *network, "--mac", wanted}, &output)) {
        return std::nullopt;
    }

    std::istringstream ss(output);
    std::string line;
    while (std::getline(ss, line)) {
        if (to_lower(line).find(wanted) == std::string::npos) continue;

        auto tokens = split_ws(line);
        for (size_t i = 0; i + 1 < tokens.size(); i++) {
            if (tokens[i] == "ipv4") {
                std::string address = tokens[i + 1];
                return address.substr(0, address.find('/'));
            }
        }
    }
    return std::nullopt;
}

std::string VirshHypervisorProvider::get_last_error() const {
    return last_error_;
}

} // namespace cloudvm
