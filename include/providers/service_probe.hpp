#pragma once

#include <memory>
#include <optional>
#include <string>

namespace cloudvm {

/**
 * ServiceProbe - Asks the host init system about service units
 */
class ServiceProbe {
public:
    virtual ~ServiceProbe() = default;

    /**
     * Get the ActiveState of a unit
     * @param unit Full unit name (e.g. "libvirtd.service")
     * @return State such as "active" or "inactive", or nullopt if the
     *         init system could not be asked
     */
    virtual std::optional<std::string> active_state(const std::string& unit) = 0;

    /**
     * Get the last error message
     */
    virtual std::string get_last_error() const = 0;

    /**
     * Create the default probe (systemd over D-Bus)
     */
    static std::unique_ptr<ServiceProbe> create_default();
};

/**
 * DaemonCheck - Outcome of looking for a running hypervisor daemon
 */
enum class DaemonCheck {
    Running,
    NotRunning,
    Unknown     // no unit state could be read
};

/**
 * Look for libvirtd or virtqemud (service or socket activation)
 */
DaemonCheck check_hypervisor_daemon(ServiceProbe& probe);

} // namespace cloudvm
