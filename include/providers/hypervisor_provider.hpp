#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cloudvm {

struct Config;

/**
 * DomainStatus - Run state of a domain as reported by the hypervisor
 */
enum class DomainStatus {
    Running,
    Paused,
    ShutOff,
    Crashed,
    Suspended,
    Unknown
};

std::string status_string(DomainStatus status);

/**
 * DomainInfo - Information about a defined domain
 */
struct DomainInfo {
    std::string name;
    int id = -1;                // -1 while inactive
    DomainStatus status = DomainStatus::Unknown;
    std::string mac_address;    // first interface, lower case
};

/**
 * DiskDevice - A disk or cdrom attached to a domain
 */
struct DiskDevice {
    std::string path;
    std::string format = "qcow2";   // driver type
    std::string target = "vda";
    std::string bus = "virtio";
    bool cdrom = false;
    std::string cache;              // empty = hypervisor default
    std::string extra_options;      // subprocess backend only
};

/**
 * NetworkDevice - Bridged network interface
 */
struct NetworkDevice {
    std::string bridge;
    std::string model = "virtio";
    std::string mac_address;        // empty = generated
    std::string extra_options;      // subprocess backend only
};

/**
 * DomainDefinition - Everything needed to define and boot a domain
 */
struct DomainDefinition {
    std::string name;
    std::string virt_type = "kvm";  // <domain type=...>
    int memory_mb = 1024;
    int vcpus = 1;
    std::string cpu_model = "host-passthrough";
    std::string os_type = "linux";
    std::string os_variant;
    std::string graphics = "spice";
    std::vector<DiskDevice> disks;
    NetworkDevice network;
};

/**
 * HypervisorProvider - Narrow interface to the hypervisor manager
 *
 * Implementations can use the libvirt API or drive virsh/virt-install.
 * Methods report failure through their return value and get_last_error().
 */
class HypervisorProvider {
public:
    virtual ~HypervisorProvider() = default;

    // ========== Domains ==========

    /**
     * Check if a domain is defined (running or not)
     * @param name Domain name
     */
    virtual bool domain_exists(const std::string& name) = 0;

    /**
     * Define a domain persistently and start it
     * @param definition Domain description
     * @return true if the domain is defined and running
     */
    virtual bool create_domain(const DomainDefinition& definition) = 0;

    /**
     * Stop a domain, gracefully first and forcibly if that fails
     * @return true if the domain is no longer running
     */
    virtual bool stop_domain(const std::string& name) = 0;

    /**
     * Undefine a domain together with its managed save image, snapshot and
     * checkpoint metadata and NVRAM
     */
    virtual bool undefine_domain(const std::string& name) = 0;

    /**
     * Enable or disable start at host boot
     */
    virtual bool set_autostart(const std::string& name, bool enabled) = 0;

    /**
     * Eject the medium in a cdrom device from the persistent config
     * @param target Device target (e.g. "sda")
     */
    virtual bool eject_media(const std::string& name, const std::string& target) = 0;

    /**
     * Attach a disk persistently, and to the live domain when it runs
     */
    virtual bool attach_disk(const std::string& name, const DiskDevice& disk) = 0;

    /**
     * Look up id, state and MAC address of a domain
     * @return DomainInfo if the domain exists
     */
    virtual std::optional<DomainInfo> query_domain_info(const std::string& name) = 0;

    /**
     * All domains regardless of state
     * @return Domains in the order the hypervisor reports them, or
     *         nullopt if the query failed
     */
    virtual std::optional<std::vector<DomainInfo>> list_domains() = 0;

    // ========== Storage pools ==========

    virtual bool pool_exists(const std::string& name) = 0;

    /**
     * Create and start a transient directory-backed pool
     * @param name Pool name
     * @param target_dir Directory the pool exposes
     */
    virtual bool create_pool(const std::string& name, const std::string& target_dir) = 0;

    /**
     * Stop a pool (and undefine it if it is persistent)
     */
    virtual bool destroy_pool(const std::string& name) = 0;

    // ========== Networks ==========

    /**
     * Check whether a bridge belongs to a hypervisor-managed network that
     * hands out DHCP leases
     */
    virtual bool is_managed_bridge(const std::string& bridge) = 0;

    /**
     * Find the address leased to a MAC on the network behind a bridge
     * @return IP address without prefix length, if a lease exists
     */
    virtual std::optional<std::string> lookup_lease(const std::string& bridge,
                                                    const std::string& mac) = 0;

    // ========== Utility ==========

    /**
     * Get the last error message
     */
    virtual std::string get_last_error() const = 0;

    /**
     * Factory for the backend selected in the configuration
     */
    static std::unique_ptr<HypervisorProvider> create(const Config& config);
};

} // namespace cloudvm
