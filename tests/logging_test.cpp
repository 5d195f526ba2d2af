#include <gtest/gtest.h>

#include "logging.hpp"

#include <spdlog/sinks/sink.h>

#include <algorithm>

TEST(LoggingTest, ConsoleLevelMovesConsoleSinkAndLoggerGate) {
    auto& logger = core::logging::getLogger();
    ASSERT_EQ(logger->sinks().size(), 2u);
    const auto& console_sink = logger->sinks()[0];
    const auto& file_sink = logger->sinks()[1];
    const auto file_level = file_sink->level();

    core::logging::setConsoleLevel(spdlog::level::trace);
    EXPECT_EQ(console_sink->level(), spdlog::level::trace);
    EXPECT_EQ(logger->level(), spdlog::level::trace);
    EXPECT_EQ(file_sink->level(), file_level);

    core::logging::setConsoleLevel(spdlog::level::err);
    EXPECT_EQ(console_sink->level(), spdlog::level::err);
    // The file sink still receives its own level
    EXPECT_EQ(logger->level(), std::min(spdlog::level::err, file_level));

    core::logging::setConsoleLevel(spdlog::level::warn);
    EXPECT_EQ(console_sink->level(), spdlog::level::warn);
}

TEST(LoggingTest, LevelNamesParseCaseInsensitively) {
    EXPECT_EQ(core::logging::level_from_string("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(core::logging::level_from_string("warning"), spdlog::level::warn);
    EXPECT_EQ(core::logging::level_from_string("off"), spdlog::level::off);
}
