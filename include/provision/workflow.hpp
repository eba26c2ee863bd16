#pragma once

#include "config/config.hpp"
#include "provision/image_fetcher.hpp"
#include "providers/host_tools_provider.hpp"
#include "providers/hypervisor_provider.hpp"
#include "utils/console.hpp"
#include <functional>
#include <string>

namespace cloudvm {

/**
 * OverwritePolicy - What create does when the domain already exists
 */
enum class OverwritePolicy {
    Prompt,
    AssumeYes,
    AssumeNo
};

/**
 * VmRequest - One VM to provision
 */
struct VmRequest {
    std::string name;
    int vcpus = 1;
    int memory_mb = 1024;
    int disk_size_gb = 10;
    std::string bridge;
    std::string mac_address;        // empty = generated by the hypervisor
    std::string ssh_public_key_path;
    std::string distro;
    std::string custom_image_path;  // overrides distro when set
    std::string dns_domain;
    bool autostart = false;
    std::string custom_script_path;
    std::string timezone;
    std::string additional_user;
    std::string graphics;
    std::string cpu_model;
    std::string network_options;
    std::string disk_options;
    OverwritePolicy overwrite = OverwritePolicy::Prompt;

    /**
     * Request for a VM using the configured defaults
     */
    static VmRequest from_config(const std::string& name, const Config& config);
};

/**
 * AddressOutcome - Result of waiting for the guest's address
 */
struct AddressOutcome {
    enum class Status {
        Found,
        NotFound,       // managed network, no lease before the timeout
        Unmanaged       // bridge has no lease service to ask
    };

    Status status = Status::NotFound;
    std::string address;
};

/**
 * ProvisionResult - What create did
 */
struct ProvisionResult {
    bool created = false;           // false when overwrite was declined
    std::string disk_path;
    std::string login_user;
    std::string mac_address;
    AddressOutcome address;
};

/**
 * ProvisioningWorkflow - Creates a VM from a cloud image
 *
 * Steps run in order and every failure ends the run with an exception:
 * validate, conflict check, resolve image, seed data, disk, seed ISO,
 * pool and domain, post-create cleanup, address discovery.
 */
class ProvisioningWorkflow {
public:
    /// Asked before overwriting under OverwritePolicy::Prompt
    using ConfirmFn = std::function<bool(const std::string& question)>;
    /// Waits between lease lookups
    using SleepFn = std::function<void(int seconds)>;

    ProvisioningWorkflow(const Config& config,
                         HypervisorProvider& hypervisor,
                         HostToolsProvider& tools,
                         Downloader& downloader,
                         const utils::Console& console,
                         ConfirmFn confirm,
                         SleepFn sleep = nullptr);

    /**
     * Provision a VM
     * @throws ValidationError for unusable input
     * @throws ExternalToolError when a provider or tool step fails
     */
    ProvisionResult run(const VmRequest& request);

    /**
     * Poll the DHCP leases of the bridge's network for a MAC
     *
     * Waits ip_poll_interval seconds between lookups, at most
     * ip_wait_timeout seconds in total.
     */
    AddressOutcome discover_address(const std::string& bridge, const std::string& mac);

private:
    struct ResolvedImage {
        std::string path;
        std::string format;         // format of the base image
        std::string disk_format;    // format of the VM disk
        uint64_t virtual_size = 0;
        std::string os_type;
        std::string os_variant;
        std::string login_user;
        OsFamily family = OsFamily::Generic;
    };

    /**
     * Check the request and look up its distribution
     * @return Text of the SSH public key
     */
    std::string validate(const VmRequest& request, ResolvedImage& image);
    bool confirm_overwrite(const VmRequest& request);
    void resolve_image(const VmRequest& request, ResolvedImage& image);
    void write_seed_files(const VmRequest& request, const ResolvedImage& image,
                          const std::string& ssh_key, const std::string& dir);
    std::string create_disk(const VmRequest& request, const ResolvedImage& image,
                            const std::string& dir);
    std::string create_seed_iso(const VmRequest& request, const std::string& dir);
    void define_domain(const VmRequest& request, const ResolvedImage& image,
                       const std::string& disk_path, const std::string& iso_path,
                       const std::string& dir);
    void finish_domain(const VmRequest& request, const std::string& dir,
                       const std::string& iso_path);

    const Config& config_;
    HypervisorProvider& hypervisor_;
    HostToolsProvider& tools_;
    Downloader& downloader_;
    const utils::Console& console_;
    ConfirmFn confirm_;
    SleepFn sleep_;
};

} // namespace cloudvm
