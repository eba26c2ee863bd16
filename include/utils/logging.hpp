#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace cloudvm {
namespace logging {

/**
 * Configure the process-wide "cloudvm" logger
 *
 * Warnings and errors always reach stderr; with verbose set, debug and above
 * do. Drops any file sinks added earlier.
 */
void init(bool verbose);

/**
 * Append everything at debug level and above to a log file
 * @param path Log file, opened in append mode
 * @return false if the file cannot be opened
 */
bool add_file_sink(const std::string& path);

/**
 * Drop file sinks added with add_file_sink()
 *
 * Called before a working directory holding the log file is deleted.
 */
void remove_file_sinks();

/**
 * The "cloudvm" logger, created on first use
 */
std::shared_ptr<spdlog::logger>& get();

} // namespace logging
} // namespace cloudvm

#define CLOUDVM_LOG_DEBUG(...)   ::cloudvm::logging::get()->debug(__VA_ARGS__)
#define CLOUDVM_LOG_INFO(...)    ::cloudvm::logging::get()->info(__VA_ARGS__)
#define CLOUDVM_LOG_WARN(...)    ::cloudvm::logging::get()->warn(__VA_ARGS__)
#define CLOUDVM_LOG_ERROR(...)   ::cloudvm::logging::get()->error(__VA_ARGS__)
