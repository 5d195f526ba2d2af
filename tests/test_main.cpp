#include <gtest/gtest.h>
#include "logging.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // Library code logs through the global logger; keep the console quiet during tests
    core::logging::initialize("backtest_lab_tests", spdlog::level::warn, spdlog::level::debug);
    return RUN_ALL_TESTS();
}
