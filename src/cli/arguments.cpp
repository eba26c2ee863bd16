#include "cli/arguments.hpp"
#include "utils/errors.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <getopt.h>

namespace cloudvm {
namespace cli {

namespace {

/**
 * Owns a mutable argv for getopt_long
 *
 * argv[0] is the subcommand name so error messages read naturally.
 */
class ArgvBuffer {
public:
    ArgvBuffer(const std::string& command, const std::vector<std::string>& args) {
        storage_.push_back(command);
        storage_.insert(storage_.end(), args.begin(), args.end());
        for (auto& s : storage_) {
            pointers_.push_back(&s[0]);
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

void reset_getopt() {
    // 0 makes glibc reinitialize its scanner state
    optind = 0;
    opterr = 0;
}

[[noreturn]] void bad_option(const std::string& command, int ch, int opt, char** argv) {
    std::string flag;
    if (opt != 0) {
        flag = std::string("-") + static_cast<char>(opt);
    } else if (optind > 0 && argv[optind - 1]) {
        flag = argv[optind - 1];
    }
    if (ch == ':') {
        throw UsageError("Option " + flag + " requires a value. See 'cloudvm help " +
                         command + "'");
    }
    throw UsageError("Unknown option " + flag + ". See 'cloudvm help " + command + "'");
}

int parse_int(const std::string& command, const std::string& flag, const char* value) {
    char* end = nullptr;
    errno = 0;
    long n = strtol(value, &end, 10);
    if (errno != 0 || end == value || *end != '\0' || n < INT_MIN || n > INT_MAX) {
        throw UsageError("Option " + flag + " expects a number, got '" + value +
                         "'. See 'cloudvm help " + command + "'");
    }
    return static_cast<int>(n);
}

std::string single_name(const std::string& command, int argc, char** argv) {
    int remaining = argc - optind;
    if (remaining != 1) {
        throw UsageError("'" + command + "' takes exactly one VM name. See 'cloudvm help " +
                         command + "'");
    }
    std::string name = argv[optind];
    if (name.empty()) {
        throw UsageError("VM name must not be empty");
    }
    return name;
}

}  // anonymous namespace

CreateOptions parse_create(const std::vector<std::string>& args) {
    static const struct option long_options[] = {
        {"autostart",    no_argument,       nullptr, 'a'},
        {"bridge",       required_argument, nullptr, 'b'},
        {"vcpus",        required_argument, nullptr, 'c'},
        {"disk-size",    required_argument, nullptr, 'd'},
        {"dns-domain",   required_argument, nullptr, 'D'},
        {"cpu-model",    required_argument, nullptr, 'f'},
        {"graphics",     required_argument, nullptr, 'g'},
        {"custom-image", required_argument, nullptr, 'i'},
        {"ssh-key",      required_argument, nullptr, 'k'},
        {"image-dir",    required_argument, nullptr, 'l'},
        {"vm-dir",       required_argument, nullptr, 'L'},
        {"memory",       required_argument, nullptr, 'm'},
        {"mac",          required_argument, nullptr, 'M'},
        {"script",       required_argument, nullptr, 's'},
        {"distro",       required_argument, nullptr, 't'},
        {"timezone",     required_argument, nullptr, 'T'},
        {"user",         required_argument, nullptr, 'u'},
        {"assume-yes",   no_argument,       nullptr, 'y'},
        {"assume-no",    no_argument,       nullptr, 'n'},
        {"verbose",      no_argument,       nullptr, 'v'},
        {nullptr, 0, nullptr, 0}
    };
    const std::string command = "create";

    CreateOptions opts;
    bool assume_yes = false;
    bool assume_no = false;

    ArgvBuffer buffer(command, args);
    char** argv = buffer.argv();
    reset_getopt();

    int ch;
    while ((ch = getopt_long(buffer.argc(), argv, ":ab:c:d:D:f:g:i:k:l:L:m:M:s:t:T:u:ynv",
                             long_options, nullptr)) != -1) {
        switch (ch) {
        case 'a':
            opts.overrides.autostart = true;
            break;
        case 'b':
            opts.overrides.bridge = optarg;
            break;
        case 'c':
            opts.overrides.vcpus = parse_int(command, "-c", optarg);
            break;
        case 'd':
            opts.overrides.disk_size_gb = parse_int(command, "-d", optarg);
            break;
        case 'D':
            opts.overrides.dns_domain = optarg;
            break;
        case 'f':
            opts.overrides.cpu_model = optarg;
            break;
        case 'g':
            opts.overrides.graphics = optarg;
            break;
        case 'i':
            opts.custom_image_path = optarg;
            break;
        case 'k':
            opts.overrides.ssh_public_key = optarg;
            break;
        case 'l':
            opts.overrides.image_dir = optarg;
            break;
        case 'L':
            opts.overrides.vm_dir = optarg;
            break;
        case 'm':
            opts.overrides.memory_mb = parse_int(command, "-m", optarg);
            break;
        case 'M':
            opts.mac_address = optarg;
            break;
        case 's':
            opts.custom_script_path = optarg;
            break;
        case 't':
            opts.overrides.distro = optarg;
            break;
        case 'T':
            opts.overrides.timezone = optarg;
            break;
        case 'u':
            opts.overrides.additional_user = optarg;
            break;
        case 'y':
            assume_yes = true;
            break;
        case 'n':
            assume_no = true;
            break;
        case 'v':
            opts.verbose = true;
            break;
        default:
            bad_option(command, ch, optopt, argv);
        }
    }

    if (assume_yes && assume_no) {
        throw UsageError("--assume-yes and --assume-no are mutually exclusive");
    }
    if (assume_yes) {
        opts.overwrite = OverwritePolicy::AssumeYes;
    } else if (assume_no) {
        opts.overwrite = OverwritePolicy::AssumeNo;
    }

    opts.name = single_name(command, buffer.argc(), argv);
    return opts;
}

RemoveOptions parse_remove(const std::vector<std::string>& args) {
    static const struct option long_options[] = {
        {"verbose", no_argument, nullptr, 'v'},
        {nullptr, 0, nullptr, 0}
    };
    const std::string command = "remove";

    RemoveOptions opts;
    ArgvBuffer buffer(command, args);
    char** argv = buffer.argv();
    reset_getopt();

    int ch;
    while ((ch = getopt_long(buffer.argc(), argv, ":v", long_options, nullptr)) != -1) {
        switch (ch) {
        case 'v':
            opts.verbose = true;
            break;
        default:
            bad_option(command, ch, optopt, argv);
        }
    }

    opts.name = single_name(command, buffer.argc(), argv);
    return opts;
}

AttachDiskOptions parse_attach_disk(const std::vector<std::string>& args) {
    static const struct option long_options[] = {
        {"disk-size",    required_argument, nullptr, 'd'},
        {"format",       required_argument, nullptr, 'f'},
        {"source-image", required_argument, nullptr, 's'},
        {"target",       required_argument, nullptr, 't'},
        {"verbose",      no_argument,       nullptr, 'v'},
        {nullptr, 0, nullptr, 0}
    };
    const std::string command = "attach-disk";

    AttachDiskOptions opts;
    bool have_size = false;
    ArgvBuffer buffer(command, args);
    char** argv = buffer.argv();
    reset_getopt();

    int ch;
    while ((ch = getopt_long(buffer.argc(), argv, ":d:f:s:t:v", long_options, nullptr)) != -1) {
        switch (ch) {
        case 'd':
            opts.request.size_gb = parse_int(command, "-d", optarg);
            have_size = true;
            break;
        case 'f':
            opts.request.format = optarg;
            break;
        case 's':
            opts.request.source_path = optarg;
            break;
        case 't':
            opts.request.target = optarg;
            break;
        case 'v':
            opts.verbose = true;
            break;
        default:
            bad_option(command, ch, optopt, argv);
        }
    }

    if (opts.request.target.empty()) {
        throw UsageError("attach-disk needs a target device (-t). See 'cloudvm help attach-disk'");
    }
    if (!have_size) {
        throw UsageError("attach-disk needs a disk size (-d). See 'cloudvm help attach-disk'");
    }

    opts.request.name = single_name(command, buffer.argc(), argv);
    return opts;
}

} // namespace cli
} // namespace cloudvm
