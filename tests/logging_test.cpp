#include "utils/logging.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

using namespace cloudvm;
using namespace cloudvm::test;

class LoggingTest : public ::testing::Test {
protected:
    void TearDown() override {
        logging::init(false);
    }
};

TEST_F(LoggingTest, QuietModeStillReportsWarnings) {
    logging::init(false);

    ::testing::internal::CaptureStderr();
    CLOUDVM_LOG_DEBUG("pool details");
    CLOUDVM_LOG_WARN("disk options ignored");
    CLOUDVM_LOG_ERROR("undefine failed");
    std::string output = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(output.find("pool details"), std::string::npos);
    EXPECT_NE(output.find("disk options ignored"), std::string::npos);
    EXPECT_NE(output.find("undefine failed"), std::string::npos);
}

TEST_F(LoggingTest, VerboseModeShowsDebug) {
    logging::init(true);

    ::testing::internal::CaptureStderr();
    CLOUDVM_LOG_DEBUG("Running: virsh list --all");
    std::string output = ::testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("Running: virsh list --all"), std::string::npos);
}

TEST_F(LoggingTest, FileSinkKeepsDebugUntilRemoved) {
    ScratchDir dir;
    std::string path = dir.file("web.log");
    logging::init(false);

    ASSERT_TRUE(logging::add_file_sink(path));
    CLOUDVM_LOG_DEBUG("qemu-img exited with 0");
    logging::remove_file_sinks();
    CLOUDVM_LOG_DEBUG("after removal");

    std::string content = read_file(path);
    EXPECT_NE(content.find("qemu-img exited with 0"), std::string::npos);
    EXPECT_EQ(content.find("after removal"), std::string::npos);
}
