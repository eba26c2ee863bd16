#include "cli/cli.hpp"
#include "utils/errors.hpp"
#include "utils/logging.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace cloudvm;
using namespace cloudvm::test;

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        home.write(".ssh/id_ed25519.pub", "ssh-ed25519 AAAA alice@host\n");
        const DistroSpec& spec = catalog::resolve("debian10");
        home.write("virt/images/" + spec.image_filename, "base");
        probe_states["libvirtd.service"] = "active";
    }

    void TearDown() override {
        logging::remove_file_sinks();
    }

    int run(const std::vector<std::string>& args, const std::string& config_file = "") {
        auto probe = std::make_unique<FakeProbe>();
        probe->states = probe_states;

        CLI cli(Config::defaults(home.path(), "alice"),
                config_file,
                [this](const Config& config) {
                    seen_uri = config.connect_uri;
                    seen_bridge = config.bridge;
                    auto hv = std::make_unique<FakeHypervisor>();
                    hv->domains = domains;
                    hv->leases["52:54:00:12:34:56"] = "192.168.122.10";
                    hypervisor = hv.get();
                    factory_calls++;
                    return hv;
                },
                std::make_unique<FakeHostTools>(),
                std::make_unique<FakeDownloader>(),
                std::move(probe),
                console,
                in);
        return cli.run(args);
    }

    ScratchDir home;
    std::map<std::string, std::string> probe_states;
    std::map<std::string, DomainInfo> domains;
    FakeHypervisor* hypervisor = nullptr;
    int factory_calls = 0;
    std::string seen_uri;
    std::string seen_bridge;
    std::istringstream in;
    std::ostringstream out;
    std::ostringstream err;
    utils::Console console{out, err, false};
};

TEST_F(CliTest, NoCommandPrintsUsage) {
    EXPECT_EQ(run({}), exit_codes::usage);
    EXPECT_NE(out.str().find("USAGE:"), std::string::npos);
}

TEST_F(CliTest, UnknownCommandIsUsageError) {
    EXPECT_EQ(run({"launch"}), exit_codes::usage);
    EXPECT_NE(err.str().find("Unknown command: launch"), std::string::npos);
}

TEST_F(CliTest, HelpCreateListsDistributions) {
    EXPECT_EQ(run({"help", "create"}), exit_codes::ok);
    EXPECT_NE(out.str().find("--assume-yes"), std::string::npos);
    EXPECT_NE(out.str().find("ubuntu2204"), std::string::npos);
    EXPECT_EQ(factory_calls, 0);
}

TEST_F(CliTest, HelpForUnknownTopic) {
    EXPECT_EQ(run({"help", "launch"}), exit_codes::usage);
}

TEST_F(CliTest, UsageErrorsHaveNoSideEffects) {
    EXPECT_EQ(run({"create", "-y", "-n", "web"}), exit_codes::usage);
    EXPECT_EQ(factory_calls, 0);
}

TEST_F(CliTest, CreateSucceeds) {
    EXPECT_EQ(run({"create", "-b", "virbr0", "web"}), exit_codes::ok);
    ASSERT_NE(hypervisor, nullptr);
    EXPECT_EQ(hypervisor->definitions.count("web"), 1u);
    EXPECT_NE(out.str().find("[OK] Created web"), std::string::npos);
}

TEST_F(CliTest, DeclinedPromptExitsZero) {
    domains["web"].name = "web";
    in.str("n\n");

    EXPECT_EQ(run({"create", "web"}), exit_codes::ok);
    EXPECT_EQ(hypervisor->definitions.count("web"), 0u);
    EXPECT_NE(out.str().find("Not overwriting web"), std::string::npos);
}

TEST_F(CliTest, AcceptedPromptOverwrites) {
    domains["web"].name = "web";
    in.str("YES\n");

    EXPECT_EQ(run({"create", "web"}), exit_codes::ok);
    EXPECT_EQ(hypervisor->definitions.count("web"), 1u);
}

TEST_F(CliTest, ValidationFailureExitsTwo) {
    EXPECT_EQ(run({"create", "-t", "beos", "web"}), exit_codes::failure);
    EXPECT_NE(err.str().find("beos"), std::string::npos);
}

TEST_F(CliTest, StoppedDaemonFailsEarly) {
    probe_states.clear();
    probe_states["libvirtd.service"] = "inactive";
    probe_states["virtqemud.socket"] = "inactive";

    EXPECT_EQ(run({"list"}), exit_codes::failure);
    EXPECT_NE(err.str().find("systemctl start libvirtd"), std::string::npos);
    EXPECT_EQ(factory_calls, 0);
}

TEST_F(CliTest, SocketActivatedDaemonIsAccepted) {
    probe_states.clear();
    probe_states["virtqemud.socket"] = "active";
    EXPECT_EQ(run({"list"}), exit_codes::ok);
}

TEST_F(CliTest, UnreachableInitSystemSkipsCheck) {
    probe_states.clear();
    EXPECT_EQ(run({"list"}), exit_codes::ok);
    EXPECT_EQ(factory_calls, 1);
}

TEST_F(CliTest, ListRejectsArguments) {
    EXPECT_EQ(run({"list", "extra"}), exit_codes::usage);
}

TEST_F(CliTest, ConfigFileFeedsFactory) {
    std::string file = home.write("cloudvmrc", R"({"connect_uri": "qemu:///session",
                                                    "bridge": "br9"})");
    probe_states.clear();
    probe_states["libvirtd.service"] = "inactive";

    // Session URIs skip the daemon check
    EXPECT_EQ(run({"list"}, file), exit_codes::ok);
    EXPECT_EQ(seen_uri, "qemu:///session");
    EXPECT_EQ(seen_bridge, "br9");
}

TEST_F(CliTest, UnknownConfigKeyWarnsOnStderr) {
    std::string file = home.write("cloudvmrc", R"({"bridge": "br9", "brigde": "br0"})");

    ::testing::internal::CaptureStderr();
    int code = run({"list"}, file);
    std::string output = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, exit_codes::ok);
    EXPECT_NE(output.find("Ignoring unknown key 'brigde'"), std::string::npos);
    EXPECT_EQ(seen_bridge, "br9");
}

TEST_F(CliTest, BrokenConfigFileExitsTwo) {
    std::string file = home.write("cloudvmrc", "[1, 2");
    EXPECT_EQ(run({"list"}, file), exit_codes::failure);
}

TEST_F(CliTest, RemoveAndAttachDisk) {
    DomainInfo web;
    web.name = "web";
    domains["web"] = web;

    EXPECT_EQ(run({"attach-disk", "-d", "5", "-t", "vdb", "web"}), exit_codes::ok);
    EXPECT_EQ(hypervisor->attached["web"].size(), 1u);

    EXPECT_EQ(run({"remove", "web"}), exit_codes::ok);
    EXPECT_EQ(hypervisor->domains.count("web"), 0u);
}
