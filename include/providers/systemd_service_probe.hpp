#pragma once

#include "service_probe.hpp"
#include <systemd/sd-bus.h>

namespace cloudvm {

/**
 * SystemdServiceProbe - Unit state lookups via the systemd D-Bus API
 */
class SystemdServiceProbe : public ServiceProbe {
public:
    SystemdServiceProbe();
    ~SystemdServiceProbe() override;

    // Prevent copying (bus handle is not copyable)
    SystemdServiceProbe(const SystemdServiceProbe&) = delete;
    SystemdServiceProbe& operator=(const SystemdServiceProbe&) = delete;

    // ServiceProbe interface
    std::optional<std::string> active_state(const std::string& unit) override;
    std::string get_last_error() const override;

private:
    /**
     * Get a string property from a unit
     * @param unit_name Full unit name
     * @param property Property name
     * @return Property value as string
     */
    std::optional<std::string> get_unit_property(
        const std::string& unit_name,
        const std::string& property);

    /**
     * Initialize the D-Bus connection
     */
    bool init_bus();

    /**
     * Cleanup the D-Bus connection
     */
    void cleanup_bus();

    sd_bus* bus_ = nullptr;
    mutable std::string last_error_;
};

} // namespace cloudvm
