#pragma once

#include "utils/exec.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cloudvm {

/**
 * ImageInfo - What qemu-img reports about a disk image
 */
struct ImageInfo {
    std::string format;
    uint64_t virtual_size = 0;   // bytes
};

/**
 * HostToolsProvider - Narrow interface to the host's image and ISO tools
 *
 * Methods report failure through their return value and get_last_error().
 */
class HostToolsProvider {
public:
    virtual ~HostToolsProvider() = default;

    /**
     * Inspect a disk image
     * @param path Image file
     * @return Format and virtual size, or nullopt on failure
     */
    virtual std::optional<ImageInfo> image_info(const std::string& path) = 0;

    /**
     * Create a copy-on-write image backed by a base image
     * @param base Backing image
     * @param base_format Format of the backing image
     * @param path New image
     * @param format Format of the new image
     */
    virtual bool create_overlay(const std::string& base,
                                const std::string& base_format,
                                const std::string& path,
                                const std::string& format) = 0;

    /**
     * Grow an image to an absolute size
     */
    virtual bool resize_image(const std::string& path, int size_gb) = 0;

    /**
     * Create an empty image (metadata preallocated for qcow2)
     */
    virtual bool create_image(const std::string& path,
                              const std::string& format,
                              int size_gb) = 0;

    /**
     * Master a cloud-init seed ISO (volume id "cidata", Joliet, Rock Ridge)
     * @param iso_path Output file
     * @param files Files placed in the ISO root
     */
    virtual bool create_seed_iso(const std::string& iso_path,
                                 const std::vector<std::string>& files) = 0;

    /**
     * Check an OS variant against the osinfo database
     */
    virtual bool os_variant_known(const std::string& variant) = 0;

    /**
     * Remove an address from the invoking user's known_hosts
     */
    virtual bool forget_host_key(const std::string& address) = 0;

    /**
     * Get the last error message
     */
    virtual std::string get_last_error() const = 0;

    /**
     * Create the default provider (subprocesses via utils::exec)
     */
    static std::unique_ptr<HostToolsProvider> create_default();
};

/**
 * ExecHostToolsProvider - Runs qemu-img, genisoimage/mkisofs, osinfo-query
 * and ssh-keygen
 */
class ExecHostToolsProvider : public HostToolsProvider {
public:
    explicit ExecHostToolsProvider(utils::CommandRunner runner = utils::exec);

    // HostToolsProvider interface
    std::optional<ImageInfo> image_info(const std::string& path) override;
    bool create_overlay(const std::string& base,
                        const std::string& base_format,
                        const std::string& path,
                        const std::string& format) override;
    bool resize_image(const std::string& path, int size_gb) override;
    bool create_image(const std::string& path,
                      const std::string& format,
                      int size_gb) override;
    bool create_seed_iso(const std::string& iso_path,
                         const std::vector<std::string>& files) override;
    bool os_variant_known(const std::string& variant) override;
    bool forget_host_key(const std::string& address) override;
    std::string get_last_error() const override;

private:
    /**
     * Run a tool, logging the command line and its output
     */
    utils::ExecResult run(const std::string& command,
                          const std::vector<std::string>& args);

    /**
     * Run a tool and record stderr as the last error on failure
     * @return true on exit code 0
     */
    bool run_checked(const std::string& command,
                     const std::vector<std::string>& args,
                     std::string* output = nullptr);

    utils::CommandRunner runner_;
    mutable std::string last_error_;
};

} // namespace cloudvm
