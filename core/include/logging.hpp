#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace core {
namespace logging {

    // Call this once at the beginning of the application (e.g., in main() or a test environment)
    void initialize(const std::string& base_log_filename = "backtest_lab",
                    spdlog::level::level_enum console_level = spdlog::level::info,
                    spdlog::level::level_enum file_level = spdlog::level::debug);

    // Get the globally configured logger. Throws if initialize() was never called.
    std::shared_ptr<spdlog::logger>& getLogger();

    // Changes the console sink's threshold after initialize(); the file sink keeps its own
    void setConsoleLevel(spdlog::level::level_enum console_level);

    // Helper function to set log level from string (useful for env vars/config files)
    spdlog::level::level_enum level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
