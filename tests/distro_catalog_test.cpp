#include "catalog/distro_catalog.hpp"
#include "utils/errors.hpp"
#include <gtest/gtest.h>

using namespace cloudvm;

TEST(DistroCatalogTest, ResolvesKnownDistribution) {
    const DistroSpec& spec = catalog::resolve("debian10");
    EXPECT_EQ(spec.id, "debian10");
    EXPECT_EQ(spec.os_variant, "debian10");
    EXPECT_EQ(spec.disk_format, "qcow2");
    EXPECT_EQ(spec.default_login_user, "debian");
    EXPECT_EQ(spec.family, OsFamily::Debian);
}

TEST(DistroCatalogTest, UnknownIdIsValidationErrorNamingIt) {
    try {
        catalog::resolve("plan9");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("plan9"), std::string::npos);
        EXPECT_EQ(e.exit_code(), exit_codes::failure);
    }
}

TEST(DistroCatalogTest, ImageUrlJoinsBaseAndFile) {
    const DistroSpec& spec = catalog::resolve("ubuntu2204");
    EXPECT_EQ(spec.image_url(),
              "https://cloud-images.ubuntu.com/jammy/current/jammy-server-cloudimg-amd64.img");
}

TEST(DistroCatalogTest, EntriesAreSortedAndUnique) {
    const auto& all = catalog::all();
    ASSERT_GE(all.size(), 17u);
    for (size_t i = 1; i < all.size(); i++) {
        EXPECT_LT(all[i - 1].id, all[i].id);
    }
    for (const auto& spec : all) {
        EXPECT_TRUE(catalog::contains(spec.id)) << spec.id;
        EXPECT_EQ(spec.disk_format, "qcow2") << spec.id;
        EXPECT_FALSE(spec.image_filename.empty()) << spec.id;
    }
}

TEST(DistroCatalogTest, FamiliesSelectFirstBootBehaviour) {
    EXPECT_EQ(catalog::resolve("centos7").family, OsFamily::RedHatLegacy);
    EXPECT_EQ(catalog::resolve("fedora33").family, OsFamily::RedHat);
    EXPECT_EQ(catalog::resolve("opensuse15").family, OsFamily::Suse);
    EXPECT_EQ(family_name(OsFamily::Ubuntu), "ubuntu");
}
