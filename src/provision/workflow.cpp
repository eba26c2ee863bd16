#include "provision/workflow.hpp"
#include "provision/lifecycle.hpp"
#include "provision/seed_data.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace cloudvm {

namespace {

const char* SEED_ISO_TARGET = "sda";
const uint64_t GIB = 1024ULL * 1024ULL * 1024ULL;

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw ExternalToolError("Writing " + path, "cannot open file");
    }
    file << content;
    file.close();
    if (!file) {
        throw ExternalToolError("Writing " + path, "write failed");
    }
}

void remove_if_present(const std::string& path) {
    std::error_code ec;
    if (fs::remove(path, ec)) {
        CLOUDVM_LOG_DEBUG("Removed {}", path);
    } else if (ec) {
        CLOUDVM_LOG_WARN("Cannot remove {}: {}", path, ec.message());
    }
}

}  // anonymous namespace

VmRequest VmRequest::from_config(const std::string& name, const Config& config) {
    VmRequest request;
    request.name = name;
    request.vcpus = config.vcpus;
    request.memory_mb = config.memory_mb;
    request.disk_size_gb = config.disk_size_gb;
    request.bridge = config.bridge;
    request.ssh_public_key_path = config.ssh_public_key;
    request.distro = config.distro;
    request.dns_domain = config.dns_domain;
    request.autostart = config.autostart;
    request.timezone = config.timezone;
    request.additional_user = config.additional_user;
    request.graphics = config.graphics;
    request.cpu_model = config.cpu_model;
    request.network_options = config.network_options;
    request.disk_options = config.disk_options;
    return request;
}

ProvisioningWorkflow::ProvisioningWorkflow(const Config& config,
                                           HypervisorProvider& hypervisor,
                                           HostToolsProvider& tools,
                                           Downloader& downloader,
                                           const utils::Console& console,
                                           ConfirmFn confirm,
                                           SleepFn sleep)
    : config_(config),
      hypervisor_(hypervisor),
      tools_(tools),
      downloader_(downloader),
      console_(console),
      confirm_(std::move(confirm)),
      sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](int seconds) {
            std::this_thread::sleep_for(std::chrono::seconds(seconds));
        };
    }
}

ProvisionResult ProvisioningWorkflow::run(const VmRequest& request) {
    ProvisionResult result;
    ResolvedImage image;

    std::string ssh_key = validate(request, image);

    if (hypervisor_.domain_exists(request.name)) {
        if (!confirm_overwrite(request)) {
            console_.warn("Not overwriting " + request.name + ". Exiting.");
            return result;
        }
        DomainLifecycle(config_, hypervisor_, tools_, console_).remove(request.name);
    }

    std::string dir = config_.vm_path(request.name);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw ExternalToolError("Creating " + dir, ec.message());
    }
    logging::add_file_sink(dir + "/" + request.name + ".log");
    CLOUDVM_LOG_INFO("Creating {} in {}", request.name, dir);

    resolve_image(request, image);
    write_seed_files(request, image, ssh_key, dir);
    result.disk_path = create_disk(request, image, dir);
    std::string iso_path = create_seed_iso(request, dir);
    define_domain(request, image, result.disk_path, iso_path, dir);
    finish_domain(request, dir, iso_path);

    result.created = true;
    result.login_user = image.login_user;

    auto info = hypervisor_.query_domain_info(request.name);
    if (info) {
        result.mac_address = info->mac_address;
    }
    if (result.mac_address.empty()) {
        result.mac_address = request.mac_address;
    }

    if (result.mac_address.empty()) {
        console_.warn("Could not read the MAC address of " + request.name);
        result.address.status = AddressOutcome::Status::NotFound;
        return result;
    }

    console_.info("MAC address: " + result.mac_address);
    result.address = discover_address(request.bridge, result.mac_address);

    switch (result.address.status) {
        case AddressOutcome::Status::Found:
            if (!tools_.forget_host_key(result.address.address)) {
                CLOUDVM_LOG_DEBUG("ssh-keygen -R {}: {}", result.address.address,
                                  tools_.get_last_error());
            }
            console_.success(request.name + " is at " + result.address.address);
            console_.info("SSH to " + request.name + ": 'ssh " + image.login_user + "@" +
                          result.address.address + "' or 'ssh " + image.login_user + "@" +
                          request.name + "'");
            break;
        case AddressOutcome::Status::NotFound:
            console_.warn("No address for " + request.name + " after " +
                          std::to_string(config_.ip_wait_timeout) + " seconds");
            break;
        case AddressOutcome::Status::Unmanaged:
            console_.warn("Bridge " + request.bridge + " is not managed by the hypervisor; "
                          "look up " + result.mac_address + " on your DHCP server");
            console_.info("SSH to " + request.name + ": 'ssh " + image.login_user +
                          "@<address>' or 'ssh " + image.login_user + "@" + request.name + "'");
            break;
    }

    return result;
}

std::string ProvisioningWorkflow::validate(const VmRequest& request, ResolvedImage& image) {
    if (request.name.empty()) {
        throw ValidationError("A VM name is required");
    }
    if (request.name.find('/') != std::string::npos) {
        throw ValidationError("VM name '" + request.name + "' must not contain '/'");
    }
    if (request.vcpus <= 0) {
        throw ValidationError("Number of vCPUs must be positive");
    }
    if (request.memory_mb <= 0) {
        throw ValidationError("Memory size must be positive");
    }
    if (request.disk_size_gb < 0) {
        throw ValidationError("Disk size must not be negative");
    }

    auto key = read_file(request.ssh_public_key_path);
    if (!key || key->empty()) {
        throw ValidationError("SSH public key " + request.ssh_public_key_path +
                              " not found or unreadable; pass one with --ssh-key");
    }

    if (!request.custom_script_path.empty() && !read_file(request.custom_script_path)) {
        throw ValidationError("Custom script " + request.custom_script_path + " is unreadable");
    }

    if (!request.custom_image_path.empty()) {
        std::error_code ec;
        if (!fs::is_regular_file(request.custom_image_path, ec)) {
            throw ValidationError("Custom image " + request.custom_image_path + " not found");
        }
        image.path = request.custom_image_path;
        image.os_type = "linux";
        image.os_variant = OS_VARIANT_AUTO;
        image.login_user = request.additional_user;
        image.family = OsFamily::Generic;
    } else {
        const DistroSpec& spec = catalog::resolve(request.distro);
        image.os_type = spec.os_type;
        image.os_variant = spec.os_variant;
        image.disk_format = spec.disk_format;
        image.login_user = spec.default_login_user;
        image.family = spec.family;
    }

    if (image.os_variant != OS_VARIANT_AUTO && !tools_.os_variant_known(image.os_variant)) {
        throw ValidationError("OS variant '" + image.os_variant + "' is not known to "
                              "osinfo-query: " + tools_.get_last_error());
    }

    return *key;
}

bool ProvisioningWorkflow::confirm_overwrite(const VmRequest& request) {
    switch (request.overwrite) {
        case OverwritePolicy::AssumeYes:
            console_.warn(request.name + " already exists, overwriting");
            return true;
        case OverwritePolicy::AssumeNo:
            return false;
        case OverwritePolicy::Prompt:
            break;
    }
    return confirm_ && confirm_(request.name + " already exists. Overwrite? [y/N]");
}

void ProvisioningWorkflow::resolve_image(const VmRequest& request, ResolvedImage& image) {
    if (request.custom_image_path.empty()) {
        const DistroSpec& spec = catalog::resolve(request.distro);
        console_.info("Checking for cloud image " + spec.image_filename);
        ImageFetcher fetcher(config_.image_dir, downloader_);
        image.path = fetcher.ensure_image(spec);
    } else {
        console_.info("Using custom image " + image.path);
    }

    auto info = tools_.image_info(image.path);
    if (!info) {
        throw ExternalToolError("Reading image info of " + image.path, tools_.get_last_error());
    }
    image.format = info->format;
    image.virtual_size = info->virtual_size;
    if (image.disk_format.empty()) {
        image.disk_format = info->format;
    }
    CLOUDVM_LOG_DEBUG("Base image {}: format {}, {} bytes", image.path, image.format,
                      image.virtual_size);
}

void ProvisioningWorkflow::write_seed_files(const VmRequest& request, const ResolvedImage& image,
                                            const std::string& ssh_key,
                                            const std::string& dir) {
    std::string user_data_path = dir + "/user-data";
    std::string meta_data_path = dir + "/meta-data";

    // Leftovers from an earlier run of the same name
    remove_if_present(user_data_path);
    remove_if_present(meta_data_path);
    remove_if_present(dir + "/" + request.name + "-cidata.iso");

    SeedInput input;
    input.hostname = request.name;
    input.dns_domain = request.dns_domain;
    input.user = request.additional_user;
    input.ssh_public_key = ssh_key;
    input.timezone = request.timezone;
    input.family = image.family;
    if (!request.custom_script_path.empty()) {
        auto script = read_file(request.custom_script_path);
        if (!script) {
            throw ValidationError("Custom script " + request.custom_script_path +
                                  " is unreadable");
        }
        input.custom_script = *script;
    }

    console_.info("Generating cloud-init seed data");
    write_file(meta_data_path, seed::meta_data(input));
    write_file(user_data_path, seed::user_data(input));
}

std::string ProvisioningWorkflow::create_disk(const VmRequest& request,
                                              const ResolvedImage& image,
                                              const std::string& dir) {
    uint64_t requested = static_cast<uint64_t>(request.disk_size_gb) * GIB;
    bool resize = false;
    if (request.disk_size_gb > 0) {
        if (requested < image.virtual_size) {
            throw ValidationError("Disk size " + std::to_string(request.disk_size_gb) +
                                  "GB is smaller than the base image (" +
                                  std::to_string(image.virtual_size / GIB) +
                                  "GB); shrinking is not supported");
        }
        resize = requested > image.virtual_size;
    }

    std::string disk_path = dir + "/" + request.name + "." + image.disk_format;
    console_.info("Creating disk " + disk_path);
    if (!tools_.create_overlay(image.path, image.format, disk_path, image.disk_format)) {
        throw ExternalToolError("Creating disk " + disk_path, tools_.get_last_error());
    }

    if (resize) {
        console_.info("Resizing disk to " + std::to_string(request.disk_size_gb) + "GB");
        if (!tools_.resize_image(disk_path, request.disk_size_gb)) {
            throw ExternalToolError("Resizing disk " + disk_path, tools_.get_last_error());
        }
    }

    return disk_path;
}

std::string ProvisioningWorkflow::create_seed_iso(const VmRequest& request,
                                                  const std::string& dir) {
    std::string iso_path = dir + "/" + request.name + "-cidata.iso";
    console_.info("Generating seed ISO " + iso_path);
    if (!tools_.create_seed_iso(iso_path, {dir + "/user-data", dir + "/meta-data"})) {
        throw ExternalToolError("Generating seed ISO", tools_.get_last_error());
    }
    return iso_path;
}

void ProvisioningWorkflow::define_domain(const VmRequest& request, const ResolvedImage& image,
                                         const std::string& disk_path,
                                         const std::string& iso_path,
                                         const std::string& dir) {
    if (hypervisor_.pool_exists(request.name)) {
        CLOUDVM_LOG_DEBUG("Replacing stale storage pool {}", request.name);
        if (!hypervisor_.destroy_pool(request.name)) {
            throw ExternalToolError("Destroying stale storage pool " + request.name,
                                    hypervisor_.get_last_error());
        }
    }

    console_.info("Creating storage pool " + request.name);
    if (!hypervisor_.create_pool(request.name, dir)) {
        throw ExternalToolError("Creating storage pool " + request.name,
                                hypervisor_.get_last_error());
    }

    DomainDefinition def;
    def.name = request.name;
    def.memory_mb = request.memory_mb;
    def.vcpus = request.vcpus;
    def.cpu_model = request.cpu_model;
    def.os_type = image.os_type;
    def.os_variant = image.os_variant;
    def.graphics = request.graphics;

    DiskDevice disk;
    disk.path = disk_path;
    disk.format = image.disk_format;
    disk.target = "vda";
    disk.bus = "virtio";
    disk.extra_options = request.disk_options;
    def.disks.push_back(disk);

    DiskDevice cdrom;
    cdrom.path = iso_path;
    cdrom.format = "raw";
    cdrom.target = SEED_ISO_TARGET;
    cdrom.bus = "sata";
    cdrom.cdrom = true;
    def.disks.push_back(cdrom);

    def.network.bridge = request.bridge;
    def.network.model = "virtio";
    def.network.mac_address = request.mac_address;
    def.network.extra_options = request.network_options;

    console_.info("Installing the domain and starting " + request.name);
    if (!hypervisor_.create_domain(def)) {
        throw ExternalToolError("Creating domain " + request.name, hypervisor_.get_last_error());
    }
}

void ProvisioningWorkflow::finish_domain(const VmRequest& request, const std::string& dir,
                                         const std::string& iso_path) {
    if (request.autostart) {
        console_.info("Enabling autostart for " + request.name);
        if (!hypervisor_.set_autostart(request.name, true)) {
            throw ExternalToolError("Enabling autostart for " + request.name,
                                    hypervisor_.get_last_error());
        }
    }

    console_.info("Ejecting seed ISO from the persistent definition");
    if (!hypervisor_.eject_media(request.name, SEED_ISO_TARGET)) {
        throw ExternalToolError("Ejecting seed ISO from " + request.name,
                                hypervisor_.get_last_error());
    }

    console_.info("Cleaning up seed files");
    remove_if_present(dir + "/user-data");
    remove_if_present(dir + "/meta-data");
    remove_if_present(iso_path);
}

AddressOutcome ProvisioningWorkflow::discover_address(const std::string& bridge,
                                                      const std::string& mac) {
    AddressOutcome outcome;

    if (!hypervisor_.is_managed_bridge(bridge)) {
        outcome.status = AddressOutcome::Status::Unmanaged;
        return outcome;
    }

    int interval = config_.ip_poll_interval > 0 ? config_.ip_poll_interval : 1;
    console_.info("Waiting for a DHCP lease on " + bridge);

    for (int waited = 0; ; waited += interval) {
        auto address = hypervisor_.lookup_lease(bridge, mac);
        if (address) {
            outcome.status = AddressOutcome::Status::Found;
            outcome.address = *address;
            return outcome;
        }
        if (waited + interval > config_.ip_wait_timeout) {
            break;
        }
        sleep_(interval);
    }

    outcome.status = AddressOutcome::Status::NotFound;
    return outcome;
}

} // namespace cloudvm
