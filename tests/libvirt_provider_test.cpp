#include "providers/libvirt_hypervisor_provider.hpp"
#include "utils/errors.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace cloudvm;

namespace {

// Built into libvirt; keeps its state in memory and needs no daemon.
// It starts with a running domain "test", an active network "default" on
// bridge virbr0 and a persistent, active pool "default-pool".
const char* TEST_URI = "test:///default";

DomainDefinition make_definition(const std::string& name) {
    DomainDefinition def;
    def.name = name;
    def.virt_type = "test";
    def.memory_mb = 512;
    def.graphics = "none";

    DiskDevice disk;
    disk.path = "/vms/" + name + "/" + name + ".qcow2";
    def.disks.push_back(disk);

    DiskDevice cdrom;
    cdrom.path = "/vms/" + name + "/" + name + "-cidata.iso";
    cdrom.format = "raw";
    cdrom.target = "sda";
    cdrom.bus = "sata";
    cdrom.cdrom = true;
    def.disks.push_back(cdrom);

    def.network.bridge = "virbr0";
    def.network.mac_address = "52:54:00:aa:bb:cc";
    return def;
}

bool unsupported(const std::string& error) {
    return error.find("not supported") != std::string::npos;
}

const DomainInfo* find_domain(const std::vector<DomainInfo>& domains, const std::string& name) {
    auto it = std::find_if(domains.begin(), domains.end(),
                           [&](const DomainInfo& d) { return d.name == name; });
    return it == domains.end() ? nullptr : &*it;
}

}  // anonymous namespace

class LibvirtProviderTest : public ::testing::Test {
protected:
    LibvirtHypervisorProvider provider{TEST_URI};
};

TEST(LibvirtProviderConnectTest, BadUriThrows) {
    EXPECT_THROW(LibvirtHypervisorProvider("bogus+nothing:///nowhere"), ExternalToolError);
}

TEST_F(LibvirtProviderTest, CreateQueryStopUndefine) {
    ASSERT_FALSE(provider.domain_exists("web"));
    ASSERT_TRUE(provider.create_domain(make_definition("web"))) << provider.get_last_error();
    EXPECT_TRUE(provider.domain_exists("web"));

    auto info = provider.query_domain_info("web");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->status, DomainStatus::Running);
    EXPECT_GT(info->id, 0);
    EXPECT_EQ(info->mac_address, "52:54:00:aa:bb:cc");

    EXPECT_TRUE(provider.set_autostart("web", true)) << provider.get_last_error();

    ASSERT_TRUE(provider.stop_domain("web")) << provider.get_last_error();
    info = provider.query_domain_info("web");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->status, DomainStatus::ShutOff);
    EXPECT_EQ(info->id, -1);

    // Already stopped
    EXPECT_TRUE(provider.stop_domain("web"));

    ASSERT_TRUE(provider.undefine_domain("web")) << provider.get_last_error();
    EXPECT_FALSE(provider.domain_exists("web"));
}

TEST_F(LibvirtProviderTest, MissingDomainSetsLastError) {
    EXPECT_FALSE(provider.domain_exists("ghost"));
    EXPECT_FALSE(provider.stop_domain("ghost"));
    EXPECT_NE(provider.get_last_error().find("ghost"), std::string::npos);
    EXPECT_FALSE(provider.undefine_domain("ghost"));
    EXPECT_FALSE(provider.query_domain_info("ghost").has_value());
}

TEST_F(LibvirtProviderTest, ListIncludesPreloadedAndNewDomains) {
    ASSERT_TRUE(provider.create_domain(make_definition("db"))) << provider.get_last_error();
    ASSERT_TRUE(provider.stop_domain("db"));

    auto domains = provider.list_domains();
    ASSERT_TRUE(domains.has_value()) << provider.get_last_error();

    const DomainInfo* preloaded = find_domain(*domains, "test");
    ASSERT_NE(preloaded, nullptr);
    EXPECT_EQ(preloaded->status, DomainStatus::Running);
    EXPECT_GT(preloaded->id, 0);

    const DomainInfo* db = find_domain(*domains, "db");
    ASSERT_NE(db, nullptr);
    EXPECT_EQ(db->status, DomainStatus::ShutOff);
    EXPECT_EQ(db->id, -1);

    EXPECT_TRUE(provider.undefine_domain("db"));
}

TEST_F(LibvirtProviderTest, EjectSeedMedia) {
    ASSERT_TRUE(provider.create_domain(make_definition("web"))) << provider.get_last_error();

    bool ejected = provider.eject_media("web", "sda");
    if (!ejected && unsupported(provider.get_last_error())) {
        GTEST_SKIP() << provider.get_last_error();
    }
    EXPECT_TRUE(ejected) << provider.get_last_error();
}

TEST_F(LibvirtProviderTest, EjectWithoutCdromFails) {
    ASSERT_TRUE(provider.create_domain(make_definition("web"))) << provider.get_last_error();

    EXPECT_FALSE(provider.eject_media("web", "sdz"));
    EXPECT_NE(provider.get_last_error().find("no cdrom at sdz"), std::string::npos);
}

TEST_F(LibvirtProviderTest, AttachDisk) {
    ASSERT_TRUE(provider.create_domain(make_definition("web"))) << provider.get_last_error();

    DiskDevice disk;
    disk.path = "/vms/web/web-vdb-5.qcow2";
    disk.target = "vdb";
    disk.cache = "none";

    bool attached = provider.attach_disk("web", disk);
    if (!attached && unsupported(provider.get_last_error())) {
        GTEST_SKIP() << provider.get_last_error();
    }
    EXPECT_TRUE(attached) << provider.get_last_error();
}

TEST_F(LibvirtProviderTest, TransientPoolLifecycle) {
    EXPECT_FALSE(provider.pool_exists("web"));
    ASSERT_TRUE(provider.create_pool("web", "/vms/web")) << provider.get_last_error();
    EXPECT_TRUE(provider.pool_exists("web"));

    ASSERT_TRUE(provider.destroy_pool("web")) << provider.get_last_error();
    EXPECT_FALSE(provider.pool_exists("web"));
}

TEST_F(LibvirtProviderTest, PersistentPoolIsUndefined) {
    ASSERT_TRUE(provider.pool_exists("default-pool"));
    ASSERT_TRUE(provider.destroy_pool("default-pool")) << provider.get_last_error();
    EXPECT_FALSE(provider.pool_exists("default-pool"));
}

TEST_F(LibvirtProviderTest, DestroyMissingPoolFails) {
    EXPECT_FALSE(provider.destroy_pool("ghost"));
    EXPECT_NE(provider.get_last_error().find("ghost"), std::string::npos);
}

TEST_F(LibvirtProviderTest, BridgeOwnership) {
    EXPECT_TRUE(provider.is_managed_bridge("virbr0"));
    EXPECT_FALSE(provider.is_managed_bridge("br-external"));
    EXPECT_FALSE(provider.lookup_lease("br-external", "52:54:00:aa:bb:cc").has_value());
}
