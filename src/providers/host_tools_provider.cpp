#include "providers/host_tools_provider.hpp"
#include "utils/logging.hpp"
#include "utils/option_string.hpp"
#include <nlohmann/json.hpp>
#include <sstream>

namespace cloudvm {

using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

}  // anonymous namespace

std::unique_ptr<HostToolsProvider> HostToolsProvider::create_default() {
    return std::make_unique<ExecHostToolsProvider>();
}

ExecHostToolsProvider::ExecHostToolsProvider(utils::CommandRunner runner)
    : runner_(std::move(runner)) {}

utils::ExecResult ExecHostToolsProvider::run(const std::string& command,
                                             const std::vector<std::string>& args) {
    CLOUDVM_LOG_DEBUG("Running: {}", utils::format_command(command, args));
    auto result = runner_(command, args);
    CLOUDVM_LOG_DEBUG("{} exited with {}", command, result.exit_code);
    if (!result.stdout_output.empty()) {
        CLOUDVM_LOG_DEBUG("stdout: {}", trim(result.stdout_output));
    }
    if (!result.stderr_output.empty()) {
        CLOUDVM_LOG_DEBUG("stderr: {}", trim(result.stderr_output));
    }
    return result;
}

bool ExecHostToolsProvider::run_checked(const std::string& command,
                                        const std::vector<std::string>& args,
                                        std::string* output) {
    auto result = run(command, args);
    if (output) {
        *output = result.stdout_output;
    }
    if (!result.ok()) {
        std::string detail = trim(result.stderr_output);
        last_error_ = command + " exited with " + std::to_string(result.exit_code) +
                      (detail.empty() ? "" : ": " + detail);
        return false;
    }
    return true;
}

std::optional<ImageInfo> ExecHostToolsProvider::image_info(const std::string& path) {
    std::string output;
    if (!run_checked("qemu-img", {"info", "--output=json", path}, &output)) {
        return std::nullopt;
    }

    try {
        json doc = json::parse(output);
        ImageInfo info;
        info.format = doc.at("format").get<std::string>();
        info.virtual_size = doc.at("virtual-size").get<uint64_t>();
        return info;
    } catch (const json::exception& e) {
        last_error_ = "Unexpected qemu-img info output for " + path + ": " + e.what();
        return std::nullopt;
    }
}

bool ExecHostToolsProvider::create_overlay(const std::string& base,
                                           const std::string& base_format,
                                           const std::string& path,
                                           const std::string& format) {
    return run_checked("qemu-img", {"create", "-q",
                                    "-f", format,
                                    "-F", base_format,
                                    "-b", base,
                                    path});
}

bool ExecHostToolsProvider::resize_image(const std::string& path, int size_gb) {
    return run_checked("qemu-img", {"resize", "-q", path, std::to_string(size_gb) + "G"});
}

bool ExecHostToolsProvider::create_image(const std::string& path,
                                         const std::string& format,
                                         int size_gb) {
    std::string options = utils::assemble(",", {
        {"size", std::to_string(size_gb) + "G"},
        {"preallocation", format == "qcow2" ? "metadata" : ""},
    });
    return run_checked("qemu-img", {"create", "-q", "-f", format, "-o", options, path});
}

bool ExecHostToolsProvider::create_seed_iso(const std::string& iso_path,
                                            const std::vector<std::string>& files) {
    std::vector<std::string> args = {
        "-output", iso_path,
        "-volid", "cidata",
        "-joliet",
        "-rock",
    };
    args.insert(args.end(), files.begin(), files.end());

    auto result = run("genisoimage", args);
    if (result.exit_code == 127) {
        CLOUDVM_LOG_DEBUG("genisoimage not available, trying mkisofs");
        return run_checked("mkisofs", args);
    }
    if (!result.ok()) {
        std::string detail = trim(result.stderr_output);
        last_error_ = "genisoimage exited with " + std::to_string(result.exit_code) +
                      (detail.empty() ? "" : ": " + detail);
        return false;
    }
    return true;
}

bool ExecHostToolsProvider::os_variant_known(const std::string& variant) {
    std::string output;
    if (!run_checked("osinfo-query", {"os", "--fields=short-id", "short-id=" + variant},
                     &output)) {
        return false;
    }

    std::istringstream ss(output);
    std::string line;
    while (std::getline(ss, line)) {
        if (trim(line) == variant) {
            return true;
        }
    }
    last_error_ = "OS variant '" + variant + "' is not in the osinfo database";
    return false;
}

bool ExecHostToolsProvider::forget_host_key(const std::string& address) {
    return run_checked("ssh-keygen", {"-R", address});
}

std::string ExecHostToolsProvider::get_last_error() const {
    return last_error_;
}

} // namespace cloudvm
