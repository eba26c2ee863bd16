#pragma once

#include "hypervisor_provider.hpp"
#include <libvirt/libvirt.h>

namespace cloudvm {

/**
 * LibvirtHypervisorProvider - Hypervisor management via the libvirt API
 *
 * Holds one connection for the lifetime of the provider.
 */
class LibvirtHypervisorProvider : public HypervisorProvider {
public:
    /**
     * Constructor
     * @param uri Connection URI (default: system-wide QEMU daemon)
     * @throws ExternalToolError if the connection cannot be opened
     */
    explicit LibvirtHypervisorProvider(const std::string& uri = "qemu:///system");

    ~LibvirtHypervisorProvider() override;

    // Prevent copying (connection handle is not copyable)
    LibvirtHypervisorProvider(const LibvirtHypervisorProvider&) = delete;
    LibvirtHypervisorProvider& operator=(const LibvirtHypervisorProvider&) = delete;

    // HypervisorProvider interface
    bool domain_exists(const std::string& name) override;
    bool create_domain(const DomainDefinition& definition) override;
    bool stop_domain(const std::string& name) override;
    bool undefine_domain(const std::string& name) override;
    bool set_autostart(const std::string& name, bool enabled) override;
    bool eject_media(const std::string& name, const std::string& target) override;
    bool attach_disk(const std::string& name, const DiskDevice& disk) override;
    std::optional<DomainInfo> query_domain_info(const std::string& name) override;
    std::optional<std::vector<DomainInfo>> list_domains() override;
    bool pool_exists(const std::string& name) override;
    bool create_pool(const std::string& name, const std::string& target_dir) override;
    bool destroy_pool(const std::string& name) override;
    bool is_managed_bridge(const std::string& bridge) override;
    std::optional<std::string> lookup_lease(const std::string& bridge,
                                            const std::string& mac) override;
    std::string get_last_error() const override;

private:
    struct DomainDeleter {
        void operator()(virDomainPtr dom) const { virDomainFree(dom); }
    };
    struct PoolDeleter {
        void operator()(virStoragePoolPtr pool) const { virStoragePoolFree(pool); }
    };
    struct NetworkDeleter {
        void operator()(virNetworkPtr net) const { virNetworkFree(net); }
    };

    using DomainHandle = std::unique_ptr<virDomain, DomainDeleter>;
    using PoolHandle = std::unique_ptr<virStoragePool, PoolDeleter>;
    using NetworkHandle = std::unique_ptr<virNetwork, NetworkDeleter>;

    /**
     * Look up a domain; sets last_error_ when it is missing
     */
    DomainHandle lookup_domain(const std::string& name);

    /**
     * Active network whose bridge is the given interface
     */
    NetworkHandle network_for_bridge(const std::string& bridge);

    /**
     * Build DomainInfo from a handle
     */
    DomainInfo describe(virDomainPtr dom);

    /**
     * Record libvirt's last error, prefixed with the failed action
     */
    void record_error(const std::string& action);

    virConnectPtr conn_ = nullptr;
    std::string uri_;
    mutable std::string last_error_;
};

} // namespace cloudvm
