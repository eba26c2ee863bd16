#include "provision/seed_data.hpp"
#include <gtest/gtest.h>

using namespace cloudvm;

namespace {

SeedInput make_input(OsFamily family) {
    SeedInput input;
    input.hostname = "web";
    input.dns_domain = "example.local";
    input.user = "alice";
    input.ssh_public_key = "ssh-ed25519 AAAAC3Nz alice@host\n";
    input.timezone = "Europe/Berlin";
    input.family = family;
    return input;
}

}  // anonymous namespace

TEST(SeedDataTest, CloudConfigCarriesIdentityAndKey) {
    YAML::Node config = seed::cloud_config(make_input(OsFamily::Debian));

    EXPECT_FALSE(config["preserve_hostname"].as<bool>());
    EXPECT_EQ(config["hostname"].as<std::string>(), "web");
    EXPECT_EQ(config["fqdn"].as<std::string>(), "web.example.local");
    EXPECT_EQ(config["timezone"].as<std::string>(), "Europe/Berlin");
    EXPECT_EQ(config["ssh_authorized_keys"][0].as<std::string>(),
              "ssh-ed25519 AAAAC3Nz alice@host");

    YAML::Node users = config["users"];
    ASSERT_EQ(users.size(), 2u);
    EXPECT_EQ(users[0].as<std::string>(), "default");
    EXPECT_EQ(users[1]["name"].as<std::string>(), "alice");
    EXPECT_EQ(users[1]["groups"][0].as<std::string>(), "sudo");
    EXPECT_EQ(users[1]["sudo"].as<std::string>(), "ALL=(ALL) NOPASSWD:ALL");
}

TEST(SeedDataTest, FamilySelectsSudoGroupAndCommands) {
    EXPECT_EQ(seed::sudo_group(OsFamily::Ubuntu), "sudo");
    EXPECT_EQ(seed::sudo_group(OsFamily::RedHat), "wheel");

    auto redhat = seed::first_boot_commands(OsFamily::RedHat);
    ASSERT_EQ(redhat.size(), 2u);
    EXPECT_EQ(redhat[0], "systemctl restart NetworkManager");
    EXPECT_EQ(redhat[1], "touch /etc/cloud/cloud-init.disabled");

    auto legacy = seed::first_boot_commands(OsFamily::RedHatLegacy);
    EXPECT_EQ(legacy.front(), "service network restart");
    EXPECT_EQ(legacy.size(), 3u);

    auto generic = seed::first_boot_commands(OsFamily::Generic);
    ASSERT_EQ(generic.size(), 1u);
    EXPECT_EQ(generic[0], "touch /etc/cloud/cloud-init.disabled");
}

TEST(SeedDataTest, UserDataIsMultipartWithCloudConfig) {
    std::string data = seed::user_data(make_input(OsFamily::Ubuntu));

    EXPECT_EQ(data.find("Content-Type: multipart/mixed; boundary=\"==BOUNDARY==\""), 0u);
    EXPECT_NE(data.find("Content-Type: text/cloud-config"), std::string::npos);
    EXPECT_NE(data.find("#cloud-config\n"), std::string::npos);
    EXPECT_NE(data.find("netplan apply"), std::string::npos);
    EXPECT_EQ(data.find("text/x-shellscript"), std::string::npos);
    EXPECT_NE(data.rfind("--==BOUNDARY==--\n"), std::string::npos);
}

TEST(SeedDataTest, CustomScriptAddedVerbatim) {
    SeedInput input = make_input(OsFamily::Debian);
    input.custom_script = "#!/bin/sh\necho hello > /tmp/hello";

    std::string data = seed::user_data(input);
    size_t script_part = data.find("Content-Type: text/x-shellscript");
    ASSERT_NE(script_part, std::string::npos);
    EXPECT_GT(script_part, data.find("text/cloud-config"));
    EXPECT_NE(data.find("#!/bin/sh\necho hello > /tmp/hello\n"), std::string::npos);
}

TEST(SeedDataTest, MetaDataNamesInstance) {
    YAML::Node meta = YAML::Load(seed::meta_data(make_input(OsFamily::Debian)));
    EXPECT_EQ(meta["instance-id"].as<std::string>(), "web");
    EXPECT_EQ(meta["local-hostname"].as<std::string>(), "web");
}
