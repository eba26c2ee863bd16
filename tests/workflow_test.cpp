#include "provision/workflow.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include "fakes.hpp"
#include <algorithm>
#include <filesystem>
#include <gtest/gtest.h>
#include <sstream>

using namespace cloudvm;
using namespace cloudvm::test;

namespace fs = std::filesystem;

class WorkflowTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = Config::defaults(home.path(), "alice");
        config.ip_wait_timeout = 5;
        config.ip_poll_interval = 1;
        key_path = home.write(".ssh/id_ed25519.pub", "ssh-ed25519 AAAA alice@host\n");

        const DistroSpec& spec = catalog::resolve("debian10");
        home.write("virt/images/" + spec.image_filename, "base");
    }

    void TearDown() override {
        logging::remove_file_sinks();
    }

    VmRequest request(const std::string& name) {
        VmRequest r = VmRequest::from_config(name, config);
        r.ssh_public_key_path = key_path;
        return r;
    }

    ProvisioningWorkflow workflow(bool answer = false) {
        return ProvisioningWorkflow(
            config, hypervisor, tools, downloader, console,
            [this, answer](const std::string& question) {
                questions.push_back(question);
                return answer;
            },
            [this](int seconds) { slept += seconds; });
    }

    ScratchDir home;
    Config config;
    std::string key_path;
    FakeHypervisor hypervisor;
    FakeHostTools tools;
    FakeDownloader downloader;
    std::ostringstream out;
    std::ostringstream err;
    utils::Console console{out, err, false};
    std::vector<std::string> questions;
    int slept = 0;
};

TEST_F(WorkflowTest, CreatesDomainAndFindsAddress) {
    hypervisor.leases["52:54:00:12:34:56"] = "192.168.122.10";

    auto result = workflow().run(request("web"));

    EXPECT_TRUE(result.created);
    EXPECT_EQ(result.address.status, AddressOutcome::Status::Found);
    EXPECT_EQ(result.address.address, "192.168.122.10");
    EXPECT_EQ(result.login_user, "debian");
    EXPECT_EQ(tools.forgotten, "192.168.122.10");
    EXPECT_EQ(downloader.fetches, 0);

    const DomainDefinition& def = hypervisor.definitions.at("web");
    ASSERT_EQ(def.disks.size(), 2u);
    EXPECT_EQ(def.disks[0].path, config.vm_path("web") + "/web.qcow2");
    EXPECT_TRUE(def.disks[1].cdrom);
    EXPECT_EQ(def.disks[1].path, config.vm_path("web") + "/web-cidata.iso");
    EXPECT_EQ(def.os_variant, "debian10");
    EXPECT_EQ(def.network.bridge, "virbr0");

    EXPECT_EQ(hypervisor.pools.count("web"), 1u);
    EXPECT_NE(out.str().find("ssh debian@192.168.122.10"), std::string::npos);
}

TEST_F(WorkflowTest, SeedFilesAreCleanedUpAfterEject) {
    workflow().run(request("web"));

    std::string dir = config.vm_path("web");
    EXPECT_FALSE(fs::exists(dir + "/user-data"));
    EXPECT_FALSE(fs::exists(dir + "/meta-data"));
    EXPECT_FALSE(fs::exists(dir + "/web-cidata.iso"));
    EXPECT_TRUE(fs::exists(dir + "/web.qcow2"));
    EXPECT_NE(std::find(hypervisor.calls.begin(), hypervisor.calls.end(), "eject_media web sda"),
              hypervisor.calls.end());
    ASSERT_EQ(tools.iso_files.size(), 2u);
    EXPECT_EQ(tools.iso_files[0], dir + "/user-data");
}

TEST_F(WorkflowTest, GrowsDiskBeyondBaseImage) {
    workflow().run(request("web"));
    EXPECT_EQ(tools.resized_to, 10);
}

TEST_F(WorkflowTest, EqualSizeIsNotResized) {
    VmRequest r = request("web");
    r.disk_size_gb = 2;
    workflow().run(r);
    EXPECT_EQ(tools.resized_to, 0);
}

TEST_F(WorkflowTest, ZeroSizeKeepsBaseImageSize) {
    VmRequest r = request("web");
    r.disk_size_gb = 0;
    auto result = workflow().run(r);
    EXPECT_TRUE(result.created);
    EXPECT_EQ(tools.resized_to, 0);
}

TEST_F(WorkflowTest, NegativeSizeIsValidationError) {
    VmRequest r = request("web");
    r.disk_size_gb = -1;
    EXPECT_THROW(workflow().run(r), ValidationError);
}

TEST_F(WorkflowTest, ShrinkIsRejectedBeforeAnyDomainWork) {
    tools.info.virtual_size = 20ULL * 1024 * 1024 * 1024;
    EXPECT_THROW(workflow().run(request("web")), ValidationError);
    EXPECT_EQ(hypervisor.definitions.count("web"), 0u);
}

TEST_F(WorkflowTest, MissingKeyIsValidationError) {
    VmRequest r = request("web");
    r.ssh_public_key_path = home.file("nope.pub");
    EXPECT_THROW(workflow().run(r), ValidationError);
    EXPECT_FALSE(fs::exists(config.vm_path("web")));
}

TEST_F(WorkflowTest, UnknownOsVariantIsValidationError) {
    VmRequest r = request("web");
    r.distro = "centos7";
    EXPECT_THROW(workflow().run(r), ValidationError);
}

TEST_F(WorkflowTest, UnknownDistroIsValidationError) {
    VmRequest r = request("web");
    r.distro = "beos";
    EXPECT_THROW(workflow().run(r), ValidationError);
}

TEST_F(WorkflowTest, PromptDeclinedLeavesExistingDomain) {
    hypervisor.domains["web"].name = "web";

    auto result = workflow(false).run(request("web"));

    EXPECT_FALSE(result.created);
    ASSERT_EQ(questions.size(), 1u);
    EXPECT_EQ(questions[0], "web already exists. Overwrite? [y/N]");
    EXPECT_EQ(hypervisor.domains.count("web"), 1u);
    EXPECT_EQ(hypervisor.definitions.count("web"), 0u);
}

TEST_F(WorkflowTest, AssumeNoNeverPrompts) {
    hypervisor.domains["web"].name = "web";
    VmRequest r = request("web");
    r.overwrite = OverwritePolicy::AssumeNo;

    auto result = workflow(true).run(r);
    EXPECT_FALSE(result.created);
    EXPECT_TRUE(questions.empty());
}

TEST_F(WorkflowTest, AssumeYesRemovesThenRecreates) {
    hypervisor.domains["web"].name = "web";
    VmRequest r = request("web");
    r.overwrite = OverwritePolicy::AssumeYes;

    auto result = workflow(false).run(r);
    EXPECT_TRUE(result.created);
    EXPECT_TRUE(questions.empty());
    auto undefine = std::find(hypervisor.calls.begin(), hypervisor.calls.end(),
                              "undefine_domain web");
    auto create = std::find(hypervisor.calls.begin(), hypervisor.calls.end(),
                            "create_domain web");
    ASSERT_NE(undefine, hypervisor.calls.end());
    EXPECT_LT(undefine, create);
}

TEST_F(WorkflowTest, DownloadsMissingImage) {
    VmRequest r = request("web");
    r.distro = "ubuntu2204";
    workflow().run(r);
    EXPECT_EQ(downloader.fetches, 1);
}

TEST_F(WorkflowTest, CustomImageUsesAutoVariantAndAdditionalUser) {
    std::string image = home.write("custom.qcow2", "img");
    VmRequest r = request("web");
    r.custom_image_path = image;

    auto result = workflow().run(r);
    EXPECT_EQ(hypervisor.definitions.at("web").os_variant, OS_VARIANT_AUTO);
    EXPECT_EQ(result.login_user, "alice");
    EXPECT_EQ(downloader.fetches, 0);
}

TEST_F(WorkflowTest, AutostartAndMacAreApplied) {
    VmRequest r = request("web");
    r.autostart = true;
    r.mac_address = "52:54:00:00:00:09";

    auto result = workflow().run(r);
    EXPECT_EQ(hypervisor.autostart.count("web"), 1u);
    EXPECT_EQ(result.mac_address, "52:54:00:00:00:09");
}

TEST_F(WorkflowTest, LeaseTimeoutIsNotFound) {
    auto result = workflow().run(request("web"));
    EXPECT_EQ(result.address.status, AddressOutcome::Status::NotFound);
    EXPECT_EQ(slept, 5);
    EXPECT_NE(out.str().find("No address for web"), std::string::npos);
}

TEST_F(WorkflowTest, LeaseFoundAfterPolling) {
    hypervisor.leases["52:54:00:12:34:56"] = "10.0.0.5";
    hypervisor.lease_appears_after = 2;

    auto result = workflow().run(request("web"));
    EXPECT_EQ(result.address.status, AddressOutcome::Status::Found);
    EXPECT_EQ(slept, 2);
}

TEST_F(WorkflowTest, UnmanagedBridgeSkipsPolling) {
    VmRequest r = request("web");
    r.bridge = "br0";

    auto result = workflow().run(r);
    EXPECT_EQ(result.address.status, AddressOutcome::Status::Unmanaged);
    EXPECT_EQ(hypervisor.lease_lookups, 0);
}

TEST_F(WorkflowTest, DomainFailureKeepsPool) {
    hypervisor.fail_create = true;
    EXPECT_THROW(workflow().run(request("web")), ExternalToolError);
    EXPECT_EQ(hypervisor.pools.count("web"), 1u);
}

TEST_F(WorkflowTest, SeedIsoFailureIsFatal) {
    tools.fail_iso = true;
    EXPECT_THROW(workflow().run(request("web")), ExternalToolError);
    EXPECT_EQ(hypervisor.definitions.count("web"), 0u);
}
