#include "catalog/distro_catalog.hpp"
#include "utils/errors.hpp"
#include <algorithm>

namespace cloudvm {

const char* const OS_VARIANT_AUTO = "auto";

std::string DistroSpec::image_url() const {
    if (!image_base_url.empty() && image_base_url.back() == '/') {
        return image_base_url + image_filename;
    }
    return image_base_url + "/" + image_filename;
}

namespace catalog {

namespace {

// Keep sorted by id; lookups use binary search.
const std::vector<DistroSpec>& table() {
    static const std::vector<DistroSpec> distros = {
        {"amazon2", "amzn2-kvm-2.0.20230320.0-x86_64.xfs.gpt.qcow2", "linux", "centos7.0",
         "https://cdn.amazonlinux.com/os-images/2.0.20230320.0/kvm",
         "qcow2", "ec2-user", OsFamily::RedHatLegacy},
        {"centos6", "CentOS-6-x86_64-GenericCloud.qcow2", "linux", "centos6.10",
         "https://cloud.centos.org/centos/6/images",
         "qcow2", "centos", OsFamily::RedHatLegacy},
        {"centos7", "CentOS-7-x86_64-GenericCloud.qcow2", "linux", "centos7.0",
         "https://cloud.centos.org/centos/7/images",
         "qcow2", "centos", OsFamily::RedHatLegacy},
        {"centos7-atomic", "CentOS-Atomic-Host-7-GenericCloud.qcow2", "linux", "centos7.0",
         "https://cloud.centos.org/centos/7/atomic/images",
         "qcow2", "centos", OsFamily::RedHatLegacy},
        {"centos8", "CentOS-8-GenericCloud-8.4.2105-20210603.0.x86_64.qcow2", "linux", "centos8",
         "https://cloud.centos.org/centos/8/x86_64/images",
         "qcow2", "centos", OsFamily::RedHat},
        {"centos8-stream", "CentOS-Stream-GenericCloud-8-20220913.0.x86_64.qcow2", "linux", "centos-stream8",
         "https://cloud.centos.org/centos/8-stream/x86_64/images",
         "qcow2", "centos", OsFamily::RedHat},
        {"debian10", "debian-10-openstack-amd64.qcow2", "linux", "debian10",
         "https://cdimage.debian.org/cdimage/openstack/current-10",
         "qcow2", "debian", OsFamily::Debian},
        {"debian11", "debian-11-generic-amd64.qcow2", "linux", "debian11",
         "https://cloud.debian.org/images/cloud/bullseye/latest",
         "qcow2", "debian", OsFamily::Debian},
        {"debian9", "debian-9-openstack-amd64.qcow2", "linux", "debian9",
         "https://cdimage.debian.org/cdimage/openstack/current-9",
         "qcow2", "debian", OsFamily::Debian},
        {"fedora31", "Fedora-Cloud-Base-31-1.9.x86_64.qcow2", "linux", "fedora31",
         "https://archives.fedoraproject.org/pub/archive/fedora/linux/releases/31/Cloud/x86_64/images",
         "qcow2", "fedora", OsFamily::RedHat},
        {"fedora32", "Fedora-Cloud-Base-32-1.6.x86_64.qcow2", "linux", "fedora32",
         "https://archives.fedoraproject.org/pub/archive/fedora/linux/releases/32/Cloud/x86_64/images",
         "qcow2", "fedora", OsFamily::RedHat},
        {"fedora33", "Fedora-Cloud-Base-33-1.2.x86_64.qcow2", "linux", "fedora33",
         "https://archives.fedoraproject.org/pub/archive/fedora/linux/releases/33/Cloud/x86_64/images",
         "qcow2", "fedora", OsFamily::RedHat},
        {"opensuse15", "openSUSE-Leap-15.2-OpenStack.x86_64.qcow2", "linux", "opensuse15.2",
         "https://download.opensuse.org/repositories/Cloud:/Images:/Leap_15.2/images",
         "qcow2", "opensuse", OsFamily::Suse},
        {"ubuntu1604", "xenial-server-cloudimg-amd64-disk1.img", "linux", "ubuntu16.04",
         "https://cloud-images.ubuntu.com/xenial/current",
         "qcow2", "ubuntu", OsFamily::Ubuntu},
        {"ubuntu1804", "bionic-server-cloudimg-amd64.img", "linux", "ubuntu18.04",
         "https://cloud-images.ubuntu.com/bionic/current",
         "qcow2", "ubuntu", OsFamily::Ubuntu},
        {"ubuntu2004", "focal-server-cloudimg-amd64.img", "linux", "ubuntu20.04",
         "https://cloud-images.ubuntu.com/focal/current",
         "qcow2", "ubuntu", OsFamily::Ubuntu},
        {"ubuntu2204", "jammy-server-cloudimg-amd64.img", "linux", "ubuntu22.04",
         "https://cloud-images.ubuntu.com/jammy/current",
         "qcow2", "ubuntu", OsFamily::Ubuntu},
    };
    return distros;
}

std::vector<DistroSpec>::const_iterator find(const std::string& distro_id) {
    const auto& distros = table();
    auto it = std::lower_bound(distros.begin(), distros.end(), distro_id,
                               [](const DistroSpec& d, const std::string& id) {
                                   return d.id < id;
                               });
    if (it != distros.end() && it->id == distro_id) {
        return it;
    }
    return distros.end();
}

}  // anonymous namespace

const DistroSpec& resolve(const std::string& distro_id) {
    auto it = find(distro_id);
    if (it == table().end()) {
        throw ValidationError("Unknown distribution '" + distro_id +
                              "'. Run 'cloudvm help create' for the list.");
    }
    return *it;
}

bool contains(const std::string& distro_id) {
    return find(distro_id) != table().end();
}

const std::vector<DistroSpec>& all() {
    return table();
}

} // namespace catalog

std::string family_name(OsFamily family) {
    switch (family) {
        case OsFamily::Debian: return "debian";
        case OsFamily::Ubuntu: return "ubuntu";
        case OsFamily::RedHat: return "redhat";
        case OsFamily::RedHatLegacy: return "redhat-legacy";
        case OsFamily::Suse: return "suse";
        case OsFamily::Generic: return "generic";
    }
    return "unknown";
}

} // namespace cloudvm
