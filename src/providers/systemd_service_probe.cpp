#include "providers/systemd_service_probe.hpp"
#include <cstring>

namespace cloudvm {

SystemdServiceProbe::SystemdServiceProbe() {
    init_bus();
}

SystemdServiceProbe::~SystemdServiceProbe() {
    cleanup_bus();
}

bool SystemdServiceProbe::init_bus() {
    int r = sd_bus_open_system(&bus_);
    if (r < 0) {
        last_error_ = "Failed to connect to system bus: " +
                      std::string(strerror(-r));
        return false;
    }
    return true;
}

void SystemdServiceProbe::cleanup_bus() {
    if (bus_) {
        sd_bus_unref(bus_);
        bus_ = nullptr;
    }
}

std::optional<std::string> SystemdServiceProbe::get_unit_property(
    const std::string& unit_name,
    const std::string& property) {
    if (!bus_) {
        last_error_ = "D-Bus connection not initialized";
        return std::nullopt;
    }

    sd_bus_error error = SD_BUS_ERROR_NULL;
    sd_bus_message* m = nullptr;
    const char* path = nullptr;

    // LoadUnit also returns a path for units that are not loaded yet
    int r = sd_bus_call_method(
        bus_,
        "org.freedesktop.systemd1",
        "/org/freedesktop/systemd1",
        "org.freedesktop.systemd1.Manager",
        "LoadUnit",
        &error,
        &m,
        "s",
        unit_name.c_str()
    );

    if (r < 0) {
        last_error_ = "Failed to load unit " + unit_name + ": " +
                      (error.message ? error.message : strerror(-r));
        sd_bus_error_free(&error);
        sd_bus_message_unref(m);
        return std::nullopt;
    }

    r = sd_bus_message_read(m, "o", &path);
    if (r < 0) {
        last_error_ = "Failed to parse unit path";
        sd_bus_error_free(&error);
        sd_bus_message_unref(m);
        return std::nullopt;
    }

    std::string unit_path(path);
    sd_bus_error_free(&error);
    sd_bus_message_unref(m);

    error = SD_BUS_ERROR_NULL;
    m = nullptr;

    r = sd_bus_get_property(
        bus_,
        "org.freedesktop.systemd1",
        unit_path.c_str(),
        "org.freedesktop.systemd1.Unit",
        property.c_str(),
        &error,
        &m,
        "s"
    );

    if (r < 0) {
        last_error_ = "Failed to get property " + property + ": " +
                      (error.message ? error.message : strerror(-r));
        sd_bus_error_free(&error);
        sd_bus_message_unref(m);
        return std::nullopt;
    }

    const char* value = nullptr;
    r = sd_bus_message_read(m, "s", &value);
    if (r < 0) {
        last_error_ = "Failed to parse property value";
        sd_bus_error_free(&error);
        sd_bus_message_unref(m);
        return std::nullopt;
    }

    std::string result(value);
    sd_bus_error_free(&error);
    sd_bus_message_unref(m);
    return result;
}

std::optional<std::string> SystemdServiceProbe::active_state(const std::string& unit) {
    return get_unit_property(unit, "ActiveState");
}

std::string SystemdServiceProbe::get_last_error() const {
    return last_error_;
}

} // namespace cloudvm
