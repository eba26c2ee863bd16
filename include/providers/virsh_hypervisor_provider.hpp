#pragma once

#include "hypervisor_provider.hpp"
#include "utils/exec.hpp"

namespace cloudvm {

/**
 * VirshHypervisorProvider - Hypervisor management by running virsh and
 * virt-install
 *
 * Every call shells out (without a shell) and checks the exit code;
 * output is parsed where a value is needed.
 */
class VirshHypervisorProvider : public HypervisorProvider {
public:
    /**
     * Constructor
     * @param uri Connection URI passed to every command with --connect
     * @param runner Process runner (default: utils::exec)
     */
    explicit VirshHypervisorProvider(const std::string& uri = "qemu:///system",
                                     utils::CommandRunner runner = utils::exec);

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

    /**
     * virt-install arguments for a definition
     */
    std::vector<std::string> virt_install_args(const DomainDefinition& definition) const;

private:
    /**
     * Run virsh with --connect prepended
     */
    utils::ExecResult virsh(const std::vector<std::string>& args) const;

    /**
     * Run virsh and record stderr as the last error on failure
     * @return true on exit code 0
     */
    bool virsh_checked(const std::vector<std::string>& args,
                       std::string* output = nullptr);

    /**
     * Name of the active network whose bridge matches
     */
    std::optional<std::string> network_for_bridge(const std::string& bridge);

    std::string uri_;
    utils::CommandRunner runner_;
    mutable std::string last_error_;
};

} // namespace cloudvm
