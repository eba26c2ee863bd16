#include "utils/option_string.hpp"
#include <gtest/gtest.h>

using namespace cloudvm::utils;

TEST(OptionStringTest, JoinsKeyValuePairsInOrder) {
    EXPECT_EQ(assemble(",", {{"bridge", "virbr0"}, {"model", "virtio"}}),
              "bridge=virbr0,model=virtio");
}

TEST(OptionStringTest, SkipsEmptyValues) {
    EXPECT_EQ(assemble(",", {{"bridge", "br0"}, {"mac", ""}, {"model", "virtio"}}),
              "bridge=br0,model=virtio");
}

TEST(OptionStringTest, PositionalEntriesRenderBare) {
    EXPECT_EQ(assemble(",", {positional("/vms/a.qcow2"), {"format", "qcow2"},
                             positional("discard=unmap")}),
              "/vms/a.qcow2,format=qcow2,discard=unmap");
}

TEST(OptionStringTest, AllEmptyYieldsEmptyString) {
    EXPECT_EQ(assemble(",", {{"a", ""}, positional("")}), "");
    EXPECT_EQ(assemble(",", {}), "");
}

TEST(OptionStringTest, PrefixedDropsFlagForEmptyOptions) {
    EXPECT_EQ(prefixed("--network=", ""), "");
    EXPECT_EQ(prefixed("--network=", "bridge=br0"), "--network=bridge=br0");
}

TEST(OptionStringTest, SeparatorIsNotLimitedToComma) {
    EXPECT_EQ(assemble(" ", {{"size", "10G"}, positional("extra")}), "size=10G extra");
}
