#pragma once

#include "config/config.hpp"
#include "provision/image_fetcher.hpp"
#include "providers/host_tools_provider.hpp"
#include "providers/hypervisor_provider.hpp"
#include "providers/service_probe.hpp"
#include "utils/console.hpp"
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace cloudvm {

/**
 * CLI - Command line interface for cloudvm
 *
 * Dispatches create, remove, attach-disk, list and help, and maps errors
 * to exit codes (0 success, 1 usage, 2 failure).
 */
class CLI {
public:
    /// Builds the hypervisor provider once the effective config is known
    using HypervisorFactory =
        std::function<std::unique_ptr<HypervisorProvider>(const Config&)>;

    /**
     * Constructor
     * @param config Defaults for this user
     * @param config_file Override file; empty to skip it
     * @param hypervisor_factory Hypervisor provider factory
     * @param tools Host tools provider
     * @param downloader Image downloader
     * @param probe Service probe for the daemon check
     * @param console Status output
     * @param in Source of answers to the overwrite prompt
     */
    CLI(Config config,
        std::string config_file,
        HypervisorFactory hypervisor_factory,
        std::unique_ptr<HostToolsProvider> tools,
        std::unique_ptr<Downloader> downloader,
        std::unique_ptr<ServiceProbe> probe,
        const utils::Console& console,
        std::istream& in = std::cin);

    ~CLI() = default;

    /**
     * Run the CLI with command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return Exit code
     */
    int run(int argc, char* argv[]);

    /**
     * Run with the arguments that follow the program name
     */
    int run(const std::vector<std::string>& args);

private:
    // Command implementations
    int cmd_create(const std::vector<std::string>& args);
    int cmd_remove(const std::vector<std::string>& args);
    int cmd_attach_disk(const std::vector<std::string>& args);
    int cmd_list(const std::vector<std::string>& args);
    int cmd_help(const std::vector<std::string>& args);

    int dispatch(const std::string& cmd, const std::vector<std::string>& args);

    // Help texts
    void print_usage() const;
    void print_create_help() const;
    void print_remove_help() const;
    void print_attach_disk_help() const;
    void print_list_help() const;

    /**
     * Merge the override file into the config
     */
    void load_config_file();

    /**
     * Fail early when the system hypervisor daemon is not running
     * @throws ValidationError if systemd reports no running daemon
     */
    void check_daemon();

    /**
     * Ask on the console; only "y" and "yes" accept
     */
    bool confirm(const std::string& question);

    Config config_;
    std::string config_file_;
    HypervisorFactory hypervisor_factory_;
    std::unique_ptr<HostToolsProvider> tools_;
    std::unique_ptr<Downloader> downloader_;
    std::unique_ptr<ServiceProbe> probe_;
    const utils::Console& console_;
    std::istream& in_;
};

} // namespace cloudvm
