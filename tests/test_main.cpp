#include "utils/logging.hpp"
#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    cloudvm::logging::init(false);
    return RUN_ALL_TESTS();
}
