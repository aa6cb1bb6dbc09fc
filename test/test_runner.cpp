// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point for the PiiRelay unit tests in test/unit/.
// Built by CMake as the piirelay_tests target.

#include <gtest/gtest.h>

#include "util/logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // Keep test output readable; failures are reported by gtest itself.
    piirelay::util::logger::setLogLevel(piirelay::util::logger::LogLevel::CRITICAL);
    return RUN_ALL_TESTS();
}
