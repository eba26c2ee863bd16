#include "cli/arguments.hpp"
#include "utils/errors.hpp"
#include <gtest/gtest.h>

using namespace cloudvm;
using namespace cloudvm::cli;

TEST(ArgumentsTest, CreateShortFlags) {
    auto opts = parse_create({"-t", "ubuntu2204", "-c", "2", "-m", "2048", "-d", "20",
                              "-b", "br0", "-a", "-y", "web"});
    EXPECT_EQ(opts.name, "web");
    EXPECT_EQ(*opts.overrides.distro, "ubuntu2204");
    EXPECT_EQ(*opts.overrides.vcpus, 2);
    EXPECT_EQ(*opts.overrides.memory_mb, 2048);
    EXPECT_EQ(*opts.overrides.disk_size_gb, 20);
    EXPECT_EQ(*opts.overrides.bridge, "br0");
    EXPECT_TRUE(*opts.overrides.autostart);
    EXPECT_EQ(opts.overwrite, OverwritePolicy::AssumeYes);
    EXPECT_FALSE(opts.verbose);
}

TEST(ArgumentsTest, CreateLongFlagsAndTrailingOptions) {
    auto opts = parse_create({"db", "--distro=fedora33", "--mac", "52:54:00:AA:BB:CC",
                              "--custom-image", "/tmp/img.qcow2", "--assume-no",
                              "--verbose"});
    EXPECT_EQ(opts.name, "db");
    EXPECT_EQ(*opts.overrides.distro, "fedora33");
    EXPECT_EQ(opts.mac_address, "52:54:00:AA:BB:CC");
    EXPECT_EQ(opts.custom_image_path, "/tmp/img.qcow2");
    EXPECT_EQ(opts.overwrite, OverwritePolicy::AssumeNo);
    EXPECT_TRUE(opts.verbose);
}

TEST(ArgumentsTest, CreateDefaultsToPrompt) {
    auto opts = parse_create({"web"});
    EXPECT_EQ(opts.overwrite, OverwritePolicy::Prompt);
    EXPECT_FALSE(opts.overrides.distro.has_value());
}

TEST(ArgumentsTest, BothAssumeFlagsAreUsageError) {
    EXPECT_THROW(parse_create({"-y", "-n", "web"}), UsageError);
}

TEST(ArgumentsTest, PositionalCountMustBeOne) {
    EXPECT_THROW(parse_create({}), UsageError);
    EXPECT_THROW(parse_create({"a", "b"}), UsageError);
    EXPECT_THROW(parse_remove({}), UsageError);
}

TEST(ArgumentsTest, UnknownFlagIsUsageError) {
    EXPECT_THROW(parse_create({"-Z", "web"}), UsageError);
    EXPECT_THROW(parse_create({"--bogus", "web"}), UsageError);
}

TEST(ArgumentsTest, MissingValueIsUsageError) {
    try {
        parse_create({"web", "-t"});
        FAIL() << "expected UsageError";
    } catch (const UsageError& e) {
        EXPECT_NE(std::string(e.what()).find("-t"), std::string::npos);
        EXPECT_EQ(e.exit_code(), exit_codes::usage);
    }
}

TEST(ArgumentsTest, NonNumericValueIsUsageError) {
    EXPECT_THROW(parse_create({"-c", "two", "web"}), UsageError);
    EXPECT_THROW(parse_create({"-m", "12x", "web"}), UsageError);
}

TEST(ArgumentsTest, ParsersCanRunRepeatedly) {
    parse_create({"-t", "debian10", "one"});
    auto opts = parse_create({"-t", "centos7", "two"});
    EXPECT_EQ(opts.name, "two");
    EXPECT_EQ(*opts.overrides.distro, "centos7");
}

TEST(ArgumentsTest, RemoveVerbose) {
    auto opts = parse_remove({"-v", "web"});
    EXPECT_EQ(opts.name, "web");
    EXPECT_TRUE(opts.verbose);
}

TEST(ArgumentsTest, AttachDiskRequiresTargetAndSize) {
    EXPECT_THROW(parse_attach_disk({"-d", "10", "web"}), UsageError);
    EXPECT_THROW(parse_attach_disk({"-t", "vdb", "web"}), UsageError);

    auto opts = parse_attach_disk({"-d", "10", "-t", "vdb", "-f", "raw", "web"});
    EXPECT_EQ(opts.request.name, "web");
    EXPECT_EQ(opts.request.target, "vdb");
    EXPECT_EQ(opts.request.size_gb, 10);
    EXPECT_EQ(opts.request.format, "raw");
    EXPECT_TRUE(opts.request.source_path.empty());
}

TEST(ArgumentsTest, AttachDiskFormatDefaultsToQcow2) {
    auto opts = parse_attach_disk({"--disk-size", "5", "--target", "vdc",
                                   "--source-image", "/data/x.qcow2", "web"});
    EXPECT_EQ(opts.request.format, "qcow2");
    EXPECT_EQ(opts.request.source_path, "/data/x.qcow2");
}
