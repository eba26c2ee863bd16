#include "providers/service_probe.hpp"
#include "providers/systemd_service_probe.hpp"
#include "utils/logging.hpp"

namespace cloudvm {

std::unique_ptr<ServiceProbe> ServiceProbe::create_default() {
    return std::make_unique<SystemdServiceProbe>();
}

DaemonCheck check_hypervisor_daemon(ServiceProbe& probe) {
    const char* units[] = {
        "libvirtd.service",
        "libvirtd.socket",
        "virtqemud.service",
        "virtqemud.socket",
    };

    bool answered = false;
    for (const char* unit : units) {
        auto state = probe.active_state(unit);
        if (!state) {
            CLOUDVM_LOG_DEBUG("No state for {}: {}", unit, probe.get_last_error());
            continue;
        }
        answered = true;
        CLOUDVM_LOG_DEBUG("{} is {}", unit, *state);
        if (*state == "active" || *state == "activating") {
            return DaemonCheck::Running;
        }
    }
    return answered ? DaemonCheck::NotRunning : DaemonCheck::Unknown;
}

} // namespace cloudvm
