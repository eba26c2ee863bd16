#include "providers/hypervisor_provider.hpp"
#include "config/config.hpp"
#include "providers/libvirt_hypervisor_provider.hpp"
#include "providers/virsh_hypervisor_provider.hpp"
#include "utils/logging.hpp"

namespace cloudvm {

std::string status_string(DomainStatus status) {
    switch (status) {
        case DomainStatus::Running: return "running";
        case DomainStatus::Paused: return "paused";
        case DomainStatus::ShutOff: return "shut off";
        case DomainStatus::Crashed: return "crashed";
        case DomainStatus::Suspended: return "suspended";
        case DomainStatus::Unknown: return "unknown";
    }
    return "unknown";
}

std::unique_ptr<HypervisorProvider> HypervisorProvider::create(const Config& config) {
    CLOUDVM_LOG_DEBUG("Using {} backend on {}", backend_name(config.backend), config.connect_uri);
    if (config.backend == Backend::Virsh) {
        return std::make_unique<VirshHypervisorProvider>(config.connect_uri);
    }
    return std::make_unique<LibvirtHypervisorProvider>(config.connect_uri);
}

} // namespace cloudvm
