#pragma once

#include "config/config.hpp"
#include "providers/host_tools_provider.hpp"
#include "providers/hypervisor_provider.hpp"
#include "utils/console.hpp"
#include <string>

namespace cloudvm {

/**
 * AttachDiskRequest - Parameters of attach-disk
 */
struct AttachDiskRequest {
    std::string name;           // domain
    std::string target;         // e.g. "vdb"
    int size_gb = 0;
    std::string format = "qcow2";
    std::string source_path;    // empty = derived from the other fields
};

/**
 * DomainLifecycle - Operations on VMs that already exist
 */
class DomainLifecycle {
public:
    DomainLifecycle(const Config& config,
                    HypervisorProvider& hypervisor,
                    HostToolsProvider& tools,
                    const utils::Console& console);

    /**
     * Remove a VM: domain, working directory and storage pool
     *
     * A running domain is stopped first; failing to stop it only warns.
     * Missing pieces are reported and skipped.
     * @throws ExternalToolError if the domain cannot be undefined, or the
     *         directory or pool cannot be removed
     */
    void remove(const std::string& name);

    /**
     * Create a new disk image and attach it to a domain
     * @return Path of the new image
     * @throws ValidationError if the domain is unknown or the image exists
     * @throws ExternalToolError if creating or attaching fails
     */
    std::string attach_disk(const AttachDiskRequest& request);

    /**
     * Print every domain as an "Id Name State" table
     * @throws ExternalToolError if the hypervisor cannot be queried
     */
    void list();

    /// <vm_dir>/<name>/<name>-<target>-<size>.<format>
    std::string default_disk_path(const AttachDiskRequest& request) const;

private:
    const Config& config_;
    HypervisorProvider& hypervisor_;
    HostToolsProvider& tools_;
    const utils::Console& console_;
};

} // namespace cloudvm
