#pragma once

#include <string>
#include <vector>

namespace cloudvm {

/**
 * OsFamily - Groups distributions whose guests take the same
 * first-boot commands
 */
enum class OsFamily {
    Debian,
    Ubuntu,
    RedHat,
    RedHatLegacy,   // sysvinit-era network service
    Suse,
    Generic         // custom images
};

/// OS variant used for custom images; skips the osinfo lookup
extern const char* const OS_VARIANT_AUTO;

/**
 * DistroSpec - Where to fetch a distribution's cloud image and how to
 * describe it to the hypervisor
 */
struct DistroSpec {
    std::string id;
    std::string image_filename;
    std::string os_type;
    std::string os_variant;
    std::string image_base_url;
    std::string disk_format;
    std::string default_login_user;
    OsFamily family;

    /// Full download URL of the image
    std::string image_url() const;
};

namespace catalog {

/**
 * Look up a distribution by id
 * @throws ValidationError naming the id when it is unknown
 */
const DistroSpec& resolve(const std::string& distro_id);

/**
 * Check whether an id is in the catalog
 */
bool contains(const std::string& distro_id);

/**
 * All entries, ordered by id
 */
const std::vector<DistroSpec>& all();

} // namespace catalog

std::string family_name(OsFamily family);

} // namespace cloudvm
