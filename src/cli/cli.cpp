#include "cli/cli.hpp"
#include "catalog/distro_catalog.hpp"
#include "cli/arguments.hpp"
#include "provision/lifecycle.hpp"
#include "provision/workflow.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>

namespace fs = std::filesystem;

namespace cloudvm {

namespace {

const char* SYSTEM_URI = "qemu:///system";

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // anonymous namespace

CLI::CLI(Config config,
         std::string config_file,
         HypervisorFactory hypervisor_factory,
         std::unique_ptr<HostToolsProvider> tools,
         std::unique_ptr<Downloader> downloader,
         std::unique_ptr<ServiceProbe> probe,
         const utils::Console& console,
         std::istream& in)
    : config_(std::move(config)),
      config_file_(std::move(config_file)),
      hypervisor_factory_(std::move(hypervisor_factory)),
      tools_(std::move(tools)),
      downloader_(std::move(downloader)),
      probe_(std::move(probe)),
      console_(console),
      in_(in) {}

int CLI::run(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) {
        args.push_back(argv[i]);
    }
    return run(args);
}

int CLI::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        print_usage();
        return exit_codes::usage;
    }

    std::string cmd = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    try {
        return dispatch(cmd, rest);
    } catch (const Error& e) {
        CLOUDVM_LOG_DEBUG("{} failed: {}", cmd, e.what());
        console_.error(e.what());
        return e.exit_code();
    } catch (const std::exception& e) {
        CLOUDVM_LOG_DEBUG("{} failed: {}", cmd, e.what());
        console_.error(e.what());
        return exit_codes::failure;
    }
}

int CLI::dispatch(const std::string& cmd, const std::vector<std::string>& args) {
    if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        return cmd_help(args);
    }

    if (cmd == "create") {
        return cmd_create(args);
    } else if (cmd == "remove") {
        return cmd_remove(args);
    } else if (cmd == "attach-disk") {
        return cmd_attach_disk(args);
    } else if (cmd == "list") {
        return cmd_list(args);
    }
    throw UsageError("Unknown command: " + cmd + ". Use 'cloudvm help' for usage.");
}

void CLI::load_config_file() {
    if (config_file_.empty()) {
        return;
    }
    config_.apply(config::load_file(config_file_));
}

void CLI::check_daemon() {
    if (config_.connect_uri != SYSTEM_URI || !probe_) {
        return;
    }

    switch (check_hypervisor_daemon(*probe_)) {
        case DaemonCheck::Running:
            break;
        case DaemonCheck::NotRunning:
            throw ValidationError("The libvirt daemon is not running. "
                                  "Start it with 'systemctl start libvirtd'");
        case DaemonCheck::Unknown:
            CLOUDVM_LOG_DEBUG("Skipping daemon check: {}", probe_->get_last_error());
            break;
    }
}

bool CLI::confirm(const std::string& question) {
    std::string answer = lower(console_.ask(question, in_));
    return answer == "y" || answer == "yes";
}

int CLI::cmd_create(const std::vector<std::string>& args) {
    auto opts = cli::parse_create(args);
    logging::init(opts.verbose);
    load_config_file();

    config_.apply(opts.overrides);
    check_daemon();

    auto hypervisor = hypervisor_factory_(config_);

    VmRequest request = VmRequest::from_config(opts.name, config_);
    request.custom_image_path = config::expand_home(opts.custom_image_path, config_.home_dir);
    request.custom_script_path = config::expand_home(opts.custom_script_path, config_.home_dir);
    request.mac_address = lower(opts.mac_address);
    request.overwrite = opts.overwrite;

    ProvisioningWorkflow workflow(
        config_, *hypervisor, *tools_, *downloader_, console_,
        [this](const std::string& question) { return confirm(question); });

    auto result = workflow.run(request);
    if (result.created) {
        console_.success("Created " + opts.name);
    }
    return exit_codes::ok;
}

int CLI::cmd_remove(const std::vector<std::string>& args) {
    auto opts = cli::parse_remove(args);
    logging::init(opts.verbose);
    load_config_file();
    check_daemon();

    auto hypervisor = hypervisor_factory_(config_);
    DomainLifecycle lifecycle(config_, *hypervisor, *tools_, console_);
    lifecycle.remove(opts.name);

    console_.success("Removed " + opts.name);
    return exit_codes::ok;
}

int CLI::cmd_attach_disk(const std::vector<std::string>& args) {
    auto opts = cli::parse_attach_disk(args);
    logging::init(opts.verbose);
    load_config_file();
    opts.request.source_path = config::expand_home(opts.request.source_path, config_.home_dir);
    check_daemon();

    std::string dir = config_.vm_path(opts.request.name);
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        logging::add_file_sink(dir + "/" + opts.request.name + ".log");
    }

    auto hypervisor = hypervisor_factory_(config_);
    DomainLifecycle lifecycle(config_, *hypervisor, *tools_, console_);
    lifecycle.attach_disk(opts.request);
    return exit_codes::ok;
}

int CLI::cmd_list(const std::vector<std::string>& args) {
    if (!args.empty()) {
        throw UsageError("'list' takes no arguments. See 'cloudvm help list'");
    }
    logging::init(false);
    load_config_file();
    check_daemon();

    auto hypervisor = hypervisor_factory_(config_);
    DomainLifecycle lifecycle(config_, *hypervisor, *tools_, console_);
    lifecycle.list();
    return exit_codes::ok;
}

int CLI::cmd_help(const std::vector<std::string>& args) {
    if (args.empty()) {
        print_usage();
        return exit_codes::ok;
    }
    if (args.size() > 1) {
        throw UsageError("'help' takes at most one command name");
    }

    const std::string& topic = args[0];
    if (topic == "create") {
        print_create_help();
    } else if (topic == "remove") {
        print_remove_help();
    } else if (topic == "attach-disk") {
        print_attach_disk_help();
    } else if (topic == "list") {
        print_list_help();
    } else if (topic == "help") {
        print_usage();
    } else {
        throw UsageError("No help for unknown command '" + topic + "'");
    }
    return exit_codes::ok;
}

void CLI::print_usage() const {
    console_.out() << R"(cloudvm - Provision KVM virtual machines from cloud images

USAGE:
  cloudvm <command> [options] [arguments]

COMMANDS:
  create [options] <name>       Create a new VM from a cloud image
  remove [-v] <name>            Remove a VM, its files and its storage pool
  attach-disk [options] <name>  Create a new disk and attach it to a VM
  list                          List all VMs
  help [command]                Show help for a command

EXAMPLES:
  # Create a Debian 10 VM with the defaults
  cloudvm create foo

  # Create an Ubuntu 22.04 VM with 2 vCPUs, 2GB of memory and a 20GB disk
  cloudvm create -t ubuntu2204 -c 2 -m 2048 -d 20 bar

  # Add a 50GB data disk as vdb
  cloudvm attach-disk -d 50 -t vdb bar

  # Remove it again
  cloudvm remove bar

CONFIGURATION:
  Defaults can be overridden in $CLOUDVM_CONFIG or ~/.cloudvmrc, a JSON
  object using the keys described in 'cloudvm help create'.
)";
}

void CLI::print_create_help() const {
    std::ostream& out = console_.out();
    out << R"(cloudvm create [options] <name>

Create a new VM from a cloud image and boot it with cloud-init.

OPTIONS:
  -a, --autostart          Start the VM when the host boots  (default: off)
  -b, --bridge <br>        Bridge to attach the VM to        (default: )" << config_.bridge << R"()
  -c, --vcpus <n>          Number of vCPUs                   (default: )" << config_.vcpus << R"()
  -d, --disk-size <GB>     Disk size in GB                   (default: )" << config_.disk_size_gb << R"()
  -D, --dns-domain <d>     DNS domain                        (default: )" << config_.dns_domain << R"()
  -f, --cpu-model <m>      CPU model                         (default: )" << config_.cpu_model << R"()
  -g, --graphics <t>       spice, vnc or none                (default: )" << config_.graphics << R"()
  -i, --custom-image <p>   Use a local image instead of a distribution
  -k, --ssh-key <path>     SSH public key                    (default: )" << config_.ssh_public_key << R"()
  -l, --image-dir <dir>    Cloud image cache                 (default: )" << config_.image_dir << R"()
  -L, --vm-dir <dir>       VM directories                    (default: )" << config_.vm_dir << R"()
  -m, --memory <MB>        Memory in MB                      (default: )" << config_.memory_mb << R"()
  -M, --mac <mac>          MAC address                       (default: generated)
  -s, --script <path>      Shell script run on first boot
  -t, --distro <id>        Distribution                      (default: )" << config_.distro << R"()
  -T, --timezone <tz>      Timezone                          (default: )" << config_.timezone << R"()
  -u, --user <name>        Additional user with sudo rights  (default: )" << config_.additional_user << R"()
  -y, --assume-yes         Overwrite an existing VM without asking
  -n, --assume-no          Never overwrite an existing VM
  -v, --verbose            Echo the full log to the terminal

DISTRIBUTIONS:
)";

    out << std::left << "  " << std::setw(18) << "ID" << std::setw(20) << "OS VARIANT"
        << "LOGIN" << std::endl;
    for (const auto& spec : catalog::all()) {
        out << std::left << "  " << std::setw(18) << spec.id << std::setw(20)
            << spec.os_variant << spec.default_login_user << std::endl;
    }
}

void CLI::print_remove_help() const {
    console_.out() << R"(cloudvm remove [-v] <name>

Stop and undefine a VM, delete its directory and destroy its storage pool.

OPTIONS:
  -v, --verbose            Echo the full log to the terminal
)";
}

void CLI::print_attach_disk_help() const {
    console_.out() << R"(cloudvm attach-disk [options] <name>

Create a new disk image and attach it to an existing VM.

OPTIONS:
  -d, --disk-size <GB>     Disk size in GB (required)
  -t, --target <dev>       Target device, e.g. vdb (required)
  -f, --format <fmt>       Image format (default: qcow2)
  -s, --source-image <p>   Image path (default: <vm-dir>/<name>/<name>-<target>-<size>.<format>)
  -v, --verbose            Echo the full log to the terminal
)";
}

void CLI::print_list_help() const {
    console_.out() << R"(cloudvm list

List all VMs known to the hypervisor, running or not.
)";
}

} // namespace cloudvm
