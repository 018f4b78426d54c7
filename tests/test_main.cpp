/**
 * @file test_main.cpp
 * @brief Test entry point - Initialize test environment and global fixtures
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace Strata {
namespace Test {

// =============================================================================
// Global Test Environment
// =============================================================================

/**
 * @brief Global test environment for the terrain tests
 *
 * Routes library logging through the terrain logger and silences it so expected
 * failures (bad configs, throwing density sources) do not flood the output.
 */
class StrataTestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        std::cout << "=== Strata Test Suite Starting ===" << std::endl;
        Logger::Initialize("", true);
        Logger::SetLevel(spdlog::level::off);
    }

    void TearDown() override {
        std::cout << "=== Strata Test Suite Complete ===" << std::endl;
        Logger::Shutdown();
    }
};

// =============================================================================
// Test Event Listener for Enhanced Output
// =============================================================================

/**
 * @brief Prints failing test names and per-suite totals
 */
class StrataTestListener : public ::testing::EmptyTestEventListener {
public:
    void OnTestEnd(const ::testing::TestInfo& test_info) override {
        if (test_info.result()->Failed()) {
            std::cout << "[  FAILED  ] " << test_info.test_suite_name() << "."
                      << test_info.name() << std::endl;
        }
    }

    void OnTestSuiteEnd(const ::testing::TestSuite& test_suite) override {
        std::cout << "Suite " << test_suite.name() << ": "
                  << test_suite.successful_test_count() << " passed, "
                  << test_suite.failed_test_count() << " failed" << std::endl;
    }
};

} // namespace Test
} // namespace Strata

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);

    ::testing::AddGlobalTestEnvironment(new Strata::Test::StrataTestEnvironment());

    if (std::getenv("STRATA_TEST_VERBOSE") != nullptr) {
        ::testing::UnitTest::GetInstance()->listeners().Append(new Strata::Test::StrataTestListener());
    }

    return RUN_ALL_TESTS();
}
