#pragma once

#include "catalog/distro_catalog.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace cloudvm {

/**
 * Downloader - Fetches a URL into a local file
 */
class Downloader {
public:
    virtual ~Downloader() = default;

    /**
     * Download a URL, appending to dest
     * @param url Source URL
     * @param dest File to append to (created if missing)
     * @param resume_from Byte offset to request; 0 downloads everything
     * @return true if the transfer completed
     */
    virtual bool fetch(const std::string& url, const std::string& dest,
                       uint64_t resume_from) = 0;

    /**
     * Get the last error message
     */
    virtual std::string get_last_error() const = 0;

    /**
     * Create the default downloader (libcurl)
     */
    static std::unique_ptr<Downloader> create_default();
};

/**
 * CurlDownloader - HTTP(S) downloads with libcurl
 *
 * Redirects are followed and HTTP error statuses fail the transfer.
 */
class CurlDownloader : public Downloader {
public:
    CurlDownloader();
    ~CurlDownloader() override;

    CurlDownloader(const CurlDownloader&) = delete;
    CurlDownloader& operator=(const CurlDownloader&) = delete;

    bool fetch(const std::string& url, const std::string& dest,
               uint64_t resume_from) override;
    std::string get_last_error() const override;

private:
    mutable std::string last_error_;
};

/**
 * ImageFetcher - Keeps base images in the local image cache
 */
class ImageFetcher {
public:
    /**
     * Constructor
     * @param image_dir Cache directory (created on demand)
     * @param downloader Transfer implementation, must outlive the fetcher
     */
    ImageFetcher(const std::string& image_dir, Downloader& downloader);

    /**
     * Make sure the base image of a distribution is present
     *
     * An existing image is returned as-is. Otherwise the image is
     * downloaded to "<file>.part", resuming an earlier partial download,
     * and renamed once complete. A failed transfer keeps the partial file.
     *
     * @return Path of the local image
     * @throws ExternalToolError if the download fails
     */
    std::string ensure_image(const DistroSpec& spec);

    /// Local path an image is cached under
    std::string image_path(const DistroSpec& spec) const;

private:
    std::string image_dir_;
    Downloader& downloader_;
};

} // namespace cloudvm
