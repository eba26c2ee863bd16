#include "providers/libvirt_hypervisor_provider.hpp"
#include "providers/domain_xml.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <libvirt/virterror.h>

namespace cloudvm {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string last_libvirt_message() {
    virErrorPtr err = virGetLastError();
    if (err && err->message) {
        return err->message;
    }
    return "unknown libvirt error";
}

DomainStatus map_state(int state) {
    switch (state) {
        case VIR_DOMAIN_RUNNING: return DomainStatus::Running;
        case VIR_DOMAIN_BLOCKED: return DomainStatus::Running;
        case VIR_DOMAIN_PAUSED: return DomainStatus::Paused;
        case VIR_DOMAIN_SHUTDOWN: return DomainStatus::Running;
        case VIR_DOMAIN_SHUTOFF: return DomainStatus::ShutOff;
        case VIR_DOMAIN_CRASHED: return DomainStatus::Crashed;
        case VIR_DOMAIN_PMSUSPENDED: return DomainStatus::Suspended;
        default: return DomainStatus::Unknown;
    }
}

// libvirt prints every error to stderr unless a handler is installed;
// messages are collected through virGetLastError() instead.
void silent_error_handler(void*, virErrorPtr) {}

}  // anonymous namespace

LibvirtHypervisorProvider::LibvirtHypervisorProvider(const std::string& uri)
    : uri_(uri) {
    virSetErrorFunc(nullptr, silent_error_handler);

    conn_ = virConnectOpen(uri_.c_str());
    if (!conn_) {
        throw ExternalToolError("Connecting to hypervisor at " + uri_,
                                last_libvirt_message());
    }
    CLOUDVM_LOG_DEBUG("Connected to {}", uri_);
}

LibvirtHypervisorProvider::~LibvirtHypervisorProvider() {
    if (conn_) {
        virConnectClose(conn_);
        conn_ = nullptr;
    }
}

void LibvirtHypervisorProvider::record_error(const std::string& action) {
    last_error_ = action + ": " + last_libvirt_message();
    CLOUDVM_LOG_DEBUG("libvirt: {}", last_error_);
}

LibvirtHypervisorProvider::DomainHandle LibvirtHypervisorProvider::lookup_domain(
    const std::string& name) {
    DomainHandle dom(virDomainLookupByName(conn_, name.c_str()));
    if (!dom) {
        record_error("Domain '" + name + "' lookup");
    }
    return dom;
}

bool LibvirtHypervisorProvider::domain_exists(const std::string& name) {
    DomainHandle dom(virDomainLookupByName(conn_, name.c_str()));
    if (!dom) {
        virErrorPtr err = virGetLastError();
        if (err && err->code != VIR_ERR_NO_DOMAIN) {
            record_error("Domain '" + name + "' lookup");
        }
        return false;
    }
    return true;
}

bool LibvirtHypervisorProvider::create_domain(const DomainDefinition& definition) {
    std::string xml;
    try {
        xml = domain_xml::build_domain(definition);
    } catch (const std::exception& e) {
        last_error_ = e.what();
        return false;
    }
    CLOUDVM_LOG_DEBUG("Domain XML for {}:\n{}", definition.name, xml);

    if (!definition.network.extra_options.empty()) {
        CLOUDVM_LOG_WARN("Extra network options are only used by the virsh backend");
    }
    for (const auto& disk : definition.disks) {
        if (!disk.extra_options.empty()) {
            CLOUDVM_LOG_WARN("Extra disk options for {} are only used by the virsh backend",
                             disk.path);
        }
    }

    DomainHandle dom(virDomainDefineXML(conn_, xml.c_str()));
    if (!dom) {
        record_error("Defining domain '" + definition.name + "'");
        return false;
    }

    if (virDomainCreate(dom.get()) < 0) {
        record_error("Starting domain '" + definition.name + "'");
        return false;
    }

    return true;
}

bool LibvirtHypervisorProvider::stop_domain(const std::string& name) {
    auto dom = lookup_domain(name);
    if (!dom) {
        return false;
    }

    if (virDomainIsActive(dom.get()) != 1) {
        return true;
    }

    if (virDomainDestroyFlags(dom.get(), VIR_DOMAIN_DESTROY_GRACEFUL) == 0) {
        return true;
    }
    CLOUDVM_LOG_DEBUG("Graceful stop of {} failed ({}), forcing", name, last_libvirt_message());

    if (virDomainDestroy(dom.get()) < 0) {
        record_error("Stopping domain '" + name + "'");
        return false;
    }
    return true;
}

bool LibvirtHypervisorProvider::undefine_domain(const std::string& name) {
    auto dom = lookup_domain(name);
    if (!dom) {
        return false;
    }

    unsigned int flags = VIR_DOMAIN_UNDEFINE_MANAGED_SAVE |
                         VIR_DOMAIN_UNDEFINE_SNAPSHOTS_METADATA |
                         VIR_DOMAIN_UNDEFINE_CHECKPOINTS_METADATA |
                         VIR_DOMAIN_UNDEFINE_NVRAM;

    if (virDomainUndefineFlags(dom.get(), flags) < 0) {
        record_error("Undefining domain '" + name + "'");
        return false;
    }
    return true;
}

bool LibvirtHypervisorProvider::set_autostart(const std::string& name, bool enabled) {
    auto dom = lookup_domain(name);
    if (!dom) {
        return false;
    }
    if (virDomainSetAutostart(dom.get(), enabled ? 1 : 0) < 0) {
        record_error("Setting autostart on '" + name + "'");
        return false;
    }
    return true;
}

bool LibvirtHypervisorProvider::eject_media(const std::string& name, const std::string& target) {
    auto dom = lookup_domain(name);
    if (!dom) {
        return false;
    }

    char* desc = virDomainGetXMLDesc(dom.get(), VIR_DOMAIN_XML_INACTIVE);
    if (!desc) {
        record_error("Reading definition of '" + name + "'");
        return false;
    }
    std::string current(desc);
    free(desc);

    auto bus = domain_xml::find_cdrom_bus(current, target);
    if (!bus) {
        last_error_ = "Domain '" + name + "' has no cdrom at " + target;
        return false;
    }

    std::string xml = domain_xml::build_empty_cdrom(target, *bus);
    if (virDomainUpdateDeviceFlags(dom.get(), xml.c_str(), VIR_DOMAIN_AFFECT_CONFIG) < 0) {
        record_error("Ejecting media from '" + name + "'");
        return false;
    }
    return true;
}

bool LibvirtHypervisorProvider::attach_disk(const std::string& name, const DiskDevice& disk) {
    auto dom = lookup_domain(name);
    if (!dom) {
        return false;
    }

    std::string xml;
    try {
        xml = domain_xml::build_disk(disk);
    } catch (const std::exception& e) {
        last_error_ = e.what();
        return false;
    }

    unsigned int flags = VIR_DOMAIN_AFFECT_CONFIG;
    if (virDomainIsActive(dom.get()) == 1) {
        flags |= VIR_DOMAIN_AFFECT_LIVE;
    }

    if (virDomainAttachDeviceFlags(dom.get(), xml.c_str(), flags) < 0) {
        record_error("Attaching " + disk.path + " to '" + name + "'");
        return false;
    }
    return true;
}

DomainInfo LibvirtHypervisorProvider::describe(virDomainPtr dom) {
    DomainInfo info;

    const char* name = virDomainGetName(dom);
    info.name = name ? name : "";

    unsigned int id = virDomainGetID(dom);
    info.id = (id == static_cast<unsigned int>(-1)) ? -1 : static_cast<int>(id);

    int state = 0;
    int reason = 0;
    if (virDomainGetState(dom, &state, &reason, 0) == 0) {
        info.status = map_state(state);
    }

    char* desc = virDomainGetXMLDesc(dom, 0);
    if (desc) {
        auto mac = domain_xml::find_mac_address(desc);
        free(desc);
        if (mac) {
            info.mac_address = *mac;
        }
    }

    return info;
}

std::optional<DomainInfo> LibvirtHypervisorProvider::query_domain_info(const std::string& name) {
    auto dom = lookup_domain(name);
    if (!dom) {
        return std::nullopt;
    }
    return describe(dom.get());
}

std::optional<std::vector<DomainInfo>> LibvirtHypervisorProvider::list_domains() {
    virDomainPtr* domains = nullptr;
    int count = virConnectListAllDomains(conn_, &domains, 0);
    if (count < 0) {
        record_error("Listing domains");
        return std::nullopt;
    }

    std::vector<DomainInfo> result;
    result.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; i++) {
        DomainHandle dom(domains[i]);
        result.push_back(describe(dom.get()));
    }
    free(domains);

    return result;
}

bool LibvirtHypervisorProvider::pool_exists(const std::string& name) {
    PoolHandle pool(virStoragePoolLookupByName(conn_, name.c_str()));
    return pool != nullptr;
}

bool LibvirtHypervisorProvider::create_pool(const std::string& name,
                                            const std::string& target_dir) {
    std::string xml;
    try {
        xml = domain_xml::build_dir_pool(name, target_dir);
    } catch (const std::exception& e) {
        last_error_ = e.what();
        return false;
    }

    PoolHandle pool(virStoragePoolCreateXML(conn_, xml.c_str(), 0));
    if (!pool) {
        record_error("Creating storage pool '" + name + "'");
        return false;
    }
    return true;
}

bool LibvirtHypervisorProvider::destroy_pool(const std::string& name) {
    PoolHandle pool(virStoragePoolLookupByName(conn_, name.c_str()));
    if (!pool) {
        record_error("Storage pool '" + name + "' lookup");
        return false;
    }

    if (virStoragePoolIsActive(pool.get()) == 1 && virStoragePoolDestroy(pool.get()) < 0) {
        record_error("Destroying storage pool '" + name + "'");
        return false;
    }

    if (virStoragePoolIsPersistent(pool.get()) == 1 && virStoragePoolUndefine(pool.get()) < 0) {
        record_error("Undefining storage pool '" + name + "'");
        return false;
    }
    return true;
}

LibvirtHypervisorProvider::NetworkHandle LibvirtHypervisorProvider::network_for_bridge(
    const std::string& bridge) {
    virNetworkPtr* networks = nullptr;
    int count = virConnectListAllNetworks(conn_, &networks, VIR_CONNECT_LIST_NETWORKS_ACTIVE);
    if (count < 0) {
        record_error("Listing networks");
        return nullptr;
    }

    NetworkHandle match;
    for (int i = 0; i < count; i++) {
        NetworkHandle net(networks[i]);
        if (match) continue;

        char* name = virNetworkGetBridgeName(net.get());
        if (!name) continue;  // e.g. macvtap or hostdev networks
        bool same = (bridge == name);
        free(name);

        if (same) {
            match = std::move(net);
        }
    }
    free(networks);

    return match;
}

bool LibvirtHypervisorProvider::is_managed_bridge(const std::string& bridge) {
    return network_for_bridge(bridge) != nullptr;
}

std::optional<std::string> LibvirtHypervisorProvider::lookup_lease(const std::string& bridge,
                                                                   const std::string& mac) {
    auto net = network_for_bridge(bridge);
    if (!net) {
        return std::nullopt;
    }

    virNetworkDHCPLeasePtr* leases = nullptr;
    std::string wanted = to_lower(mac);
    int count = virNetworkGetDHCPLeases(net.get(), wanted.c_str(), &leases, 0);
    if (count < 0) {
        record_error("Reading DHCP leases on " + bridge);
        return std::nullopt;
    }

    std::optional<std::string> address;
    for (int i = 0; i < count; i++) {
        virNetworkDHCPLeasePtr lease = leases[i];
        if (!address && lease->ipaddr && lease->mac && to_lower(lease->mac) == wanted &&
            lease->type == VIR_IP_ADDR_TYPE_IPV4) {
            address = std::string(lease->ipaddr);
        }
        virNetworkDHCPLeaseFree(lease);
    }
    free(leases);

    return address;
}

std::string LibvirtHypervisorProvider::get_last_error() const {
    return last_error_;
}

} // namespace cloudvm
