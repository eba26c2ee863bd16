#include "provision/image_fetcher.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include <cstdio>
#include <curl/curl.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace cloudvm {

std::unique_ptr<Downloader> Downloader::create_default() {
    return std::make_unique<CurlDownloader>();
}

CurlDownloader::CurlDownloader() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlDownloader::~CurlDownloader() {
    curl_global_cleanup();
}

bool CurlDownloader::fetch(const std::string& url, const std::string& dest,
                           uint64_t resume_from) {
    CURL* curl = curl_easy_init();
    if (curl == nullptr) {
        last_error_ = "Failed to initialize curl";
        return false;
    }

    FILE* file = fopen(dest.c_str(), "ab");
    if (file == nullptr) {
        last_error_ = "Failed to open " + dest + " for writing";
        curl_easy_cleanup(curl);
        return false;
    }

    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, file);
    if (resume_from > 0) {
        curl_easy_setopt(curl, CURLOPT_RESUME_FROM_LARGE,
                         static_cast<curl_off_t>(resume_from));
    }

    CURLcode res = curl_easy_perform(curl);

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    CLOUDVM_LOG_DEBUG("GET {} finished with HTTP {}", url, status);

    bool closed = (fclose(file) == 0);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        last_error_ = "Failed to download " + url + ": " +
                      (errbuf[0] ? std::string(errbuf) : curl_easy_strerror(res));
        return false;
    }
    if (!closed) {
        last_error_ = "Failed to write " + dest;
        return false;
    }
    return true;
}

std::string CurlDownloader::get_last_error() const {
    return last_error_;
}

ImageFetcher::ImageFetcher(const std::string& image_dir, Downloader& downloader)
    : image_dir_(image_dir), downloader_(downloader) {}

std::string ImageFetcher::image_path(const DistroSpec& spec) const {
    return image_dir_ + "/" + spec.image_filename;
}

std::string ImageFetcher::ensure_image(const DistroSpec& spec) {
    std::string path = image_path(spec);
    std::error_code ec;

    if (fs::exists(path, ec)) {
        CLOUDVM_LOG_INFO("Cloud image found: {}", path);
        return path;
    }

    fs::create_directories(image_dir_, ec);
    if (ec) {
        throw ExternalToolError("Creating image directory " + image_dir_, ec.message());
    }

    std::string partial = path + ".part";
    uint64_t offset = 0;
    if (fs::exists(partial, ec)) {
        offset = fs::file_size(partial, ec);
        if (ec) {
            offset = 0;
        }
        CLOUDVM_LOG_INFO("Resuming download of {} at byte {}", spec.image_url(), offset);
    } else {
        CLOUDVM_LOG_INFO("Downloading {}", spec.image_url());
    }

    if (!downloader_.fetch(spec.image_url(), partial, offset)) {
        throw ExternalToolError("Downloading " + spec.image_filename,
                                downloader_.get_last_error());
    }

    fs::rename(partial, path, ec);
    if (ec) {
        throw ExternalToolError("Renaming " + partial, ec.message());
    }

    CLOUDVM_LOG_INFO("Saved cloud image to {}", path);
    return path;
}

} // namespace cloudvm
