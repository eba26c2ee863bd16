#include "cli/cli.hpp"
#include "config/config.hpp"
#include "provision/image_fetcher.hpp"
#include "providers/host_tools_provider.hpp"
#include "providers/hypervisor_provider.hpp"
#include "providers/service_probe.hpp"
#include "utils/console.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    auto console = cloudvm::utils::Console::standard();

    try {
        cloudvm::logging::init(false);

        auto config = cloudvm::Config::defaults();
        std::string config_file = cloudvm::config::default_file_path(config.home_dir);

        cloudvm::CLI cli(std::move(config),
                         std::move(config_file),
                         &cloudvm::HypervisorProvider::create,
                         cloudvm::HostToolsProvider::create_default(),
                         cloudvm::Downloader::create_default(),
                         cloudvm::ServiceProbe::create_default(),
                         console);
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        console.error(e.what());
        return cloudvm::exit_codes::failure;
    }
}
