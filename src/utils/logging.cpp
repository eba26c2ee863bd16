#include "utils/logging.hpp"
#include <algorithm>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace cloudvm {
namespace logging {

namespace {

const char* LOGGER_NAME = "cloudvm";
const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";
const char* CONSOLE_PATTERN = "%^[%l]%$ %v";

std::shared_ptr<spdlog::logger> instance;

}  // anonymous namespace

std::shared_ptr<spdlog::logger>& get() {
    if (!instance) {
        instance = std::make_shared<spdlog::logger>(LOGGER_NAME);
        instance->set_level(spdlog::level::debug);
        instance->flush_on(spdlog::level::debug);
    }
    return instance;
}

void init(bool verbose) {
    auto& logger = get();
    logger->sinks().clear();

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
    console->set_pattern(CONSOLE_PATTERN);
    logger->sinks().push_back(console);
}

bool add_file_sink(const std::string& path) {
    try {
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
        file->set_level(spdlog::level::debug);
        file->set_pattern(FILE_PATTERN);
        get()->sinks().push_back(file);
    } catch (const spdlog::spdlog_ex& e) {
        get()->warn("Cannot open log file {}: {}", path, e.what());
        return false;
    }
    return true;
}

void remove_file_sinks() {
    auto& sinks = get()->sinks();
    sinks.erase(std::remove_if(sinks.begin(), sinks.end(),
                               [](const spdlog::sink_ptr& sink) {
                                   return std::dynamic_pointer_cast<
                                       spdlog::sinks::basic_file_sink_mt>(sink) != nullptr;
                               }),
                sinks.end());
}

} // namespace logging
} // namespace cloudvm
