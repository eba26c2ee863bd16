#include "provision/lifecycle.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include <filesystem>
#include <iomanip>

namespace fs = std::filesystem;

namespace cloudvm {

DomainLifecycle::DomainLifecycle(const Config& config,
                                 HypervisorProvider& hypervisor,
                                 HostToolsProvider& tools,
                                 const utils::Console& console)
    : config_(config), hypervisor_(hypervisor), tools_(tools), console_(console) {}

void DomainLifecycle::remove(const std::string& name) {
    if (hypervisor_.domain_exists(name)) {
        console_.info("Stopping domain " + name);
        if (!hypervisor_.stop_domain(name)) {
            console_.warn("Could not stop " + name + ": " + hypervisor_.get_last_error());
            CLOUDVM_LOG_DEBUG("Stopping {} failed: {}", name, hypervisor_.get_last_error());
        }

        console_.info("Undefining domain " + name);
        if (!hypervisor_.undefine_domain(name)) {
            throw ExternalToolError("Undefining domain " + name, hypervisor_.get_last_error());
        }
    } else {
        console_.info("Domain " + name + " does not exist");
    }

    std::string dir = config_.vm_path(name);
    std::error_code ec;
    if (fs::exists(dir, ec)) {
        // The log file lives in this directory
        logging::remove_file_sinks();
        console_.info("Deleting " + dir);
        fs::remove_all(dir, ec);
        if (ec) {
            throw ExternalToolError("Deleting " + dir, ec.message());
        }
    } else {
        console_.info("Directory " + dir + " does not exist");
    }

    if (hypervisor_.pool_exists(name)) {
        console_.info("Destroying storage pool " + name);
        if (!hypervisor_.destroy_pool(name)) {
            throw ExternalToolError("Destroying storage pool " + name,
                                    hypervisor_.get_last_error());
        }
    } else {
        console_.info("Storage pool " + name + " does not exist");
    }
}

std::string DomainLifecycle::default_disk_path(const AttachDiskRequest& request) const {
    return config_.vm_path(request.name) + "/" + request.name + "-" + request.target + "-" +
           std::to_string(request.size_gb) + "." + request.format;
}

std::string DomainLifecycle::attach_disk(const AttachDiskRequest& request) {
    if (request.size_gb <= 0) {
        throw ValidationError("Disk size must be a positive number of GB");
    }
    if (!hypervisor_.domain_exists(request.name)) {
        throw ValidationError("Domain " + request.name + " does not exist");
    }

    std::string path = request.source_path.empty() ? default_disk_path(request)
                                                   : request.source_path;

    std::error_code ec;
    if (fs::exists(path, ec)) {
        throw ValidationError(path + " already exists; choose another target or source image");
    }

    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw ExternalToolError("Creating " + parent.string(), ec.message());
        }
    }

    console_.info("Creating " + std::to_string(request.size_gb) + "GB " + request.format +
                  " image " + path);
    if (!tools_.create_image(path, request.format, request.size_gb)) {
        throw ExternalToolError("Creating disk image " + path, tools_.get_last_error());
    }

    DiskDevice disk;
    disk.path = path;
    disk.format = request.format;
    disk.target = request.target;
    disk.bus = "virtio";
    disk.cache = "none";

    console_.info("Attaching " + path + " to " + request.name + " as " + request.target);
    if (!hypervisor_.attach_disk(request.name, disk)) {
        throw ExternalToolError("Attaching " + path + " to " + request.name,
                                hypervisor_.get_last_error());
    }

    console_.success("Attached " + request.target + " to " + request.name);
    return path;
}

void DomainLifecycle::list() {
    auto domains = hypervisor_.list_domains();
    if (!domains) {
        throw ExternalToolError("Listing domains", hypervisor_.get_last_error());
    }

    std::ostream& out = console_.out();
    out << std::left
        << " " << std::setw(6) << "Id"
        << std::setw(31) << "Name"
        << "State" << std::endl;
    out << std::string(50, '-') << std::endl;

    for (const auto& domain : *domains) {
        out << std::left
            << " " << std::setw(6) << (domain.id < 0 ? "-" : std::to_string(domain.id))
            << std::setw(31) << domain.name
            << status_string(domain.status) << std::endl;
    }
}

} // namespace cloudvm
