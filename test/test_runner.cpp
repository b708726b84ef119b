// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point for the StmtGuard unit tests in test/unit/.
// Logging is raised to ERROR so test output stays readable.

#include <gtest/gtest.h>

#include "util/logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    stmtguard::util::logger::setLogLevel(stmtguard::util::logger::LogLevel::ERROR);
    return RUN_ALL_TESTS();
}
