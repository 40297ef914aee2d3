#include <gtest/gtest.h>
#include <core/log.hpp>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // Keep test output readable; individual tests capture logs to files
    log_init("", LogLevel::Error, false);
    return RUN_ALL_TESTS();
}
