#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>
#include <memory>
#include <iostream>
#include <cstdlib>
#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>      // For std::put_time
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace core {
namespace logging {

    namespace {

        std::shared_ptr<spdlog::logger> global_logger;
        spdlog::sink_ptr console_sink_ptr;
        spdlog::sink_ptr file_sink_ptr;

        constexpr const char* kLoggerName = "BacktestLab";
        constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";
        constexpr std::size_t kMaxFileSize = 10 * 1024 * 1024;
        constexpr std::size_t kMaxFiles = 5;

        // logs/<base>_<UTC start time>.log, or ./ when logs/ cannot be created
        std::string logFilePath(const std::string& base_log_filename) {
            std::string log_dir = "logs";
            try {
                std::filesystem::create_directories(log_dir);
            } catch (const std::filesystem::filesystem_error& fs_err) {
                std::cerr << "[Logging] Cannot create '" << log_dir << "': " << fs_err.what()
                          << ". Writing logs to the working directory." << std::endl;
                log_dir = ".";
            }

            const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc_tm{};
            #ifdef _WIN32
                gmtime_s(&utc_tm, &now);
            #else
                gmtime_r(&now, &utc_tm);
            #endif

            std::ostringstream oss;
            oss << log_dir << "/" << base_log_filename << "_" << std::put_time(&utc_tm, "%Y%m%d_%H%M%SZ") << ".log";
            return oss.str();
        }

    } // anonymous namespace

    void initialize(const std::string& base_log_filename,
                    spdlog::level::level_enum console_level,
                    spdlog::level::level_enum file_level)
    {
        // SPDLOG_LEVEL overrides both sinks, e.g. for a verbose CI run
        if (const char* env_level = std::getenv("SPDLOG_LEVEL")) {
            console_level = level_from_string(env_level);
            file_level = console_level;
        }

        try {
            const std::string log_file_path = logFilePath(base_log_filename);

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(console_level);
            console_sink->set_pattern(kPattern);

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, kMaxFileSize, kMaxFiles, true);
            file_sink->set_level(file_level);
            file_sink->set_pattern(kPattern);

            // A second initialize() (e.g. tests after the CLI setup) replaces the logger
            if (global_logger) {
                spdlog::drop(global_logger->name());
            }
            std::vector<spdlog::sink_ptr> sinks {console_sink, file_sink};
            global_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
            global_logger->set_level(std::min(console_level, file_level));
            console_sink_ptr = console_sink;
            file_sink_ptr = file_sink;
            spdlog::register_logger(global_logger);
            spdlog::set_default_logger(global_logger);
            spdlog::flush_on(spdlog::level::err);

            global_logger->info("Logging initialized. Console: {}, File: {} -> {}",
                                spdlog::level::to_string_view(console_level),
                                spdlog::level::to_string_view(file_level),
                                log_file_path);
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
            throw;
        }
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        if (!global_logger) {
            throw std::runtime_error("Logger accessed before initialization. Call core::logging::initialize() first.");
        }
        return global_logger;
    }

    void setConsoleLevel(spdlog::level::level_enum console_level) {
        auto& logger = getLogger();
        console_sink_ptr->set_level(console_level);
        // The logger gate must pass whichever sink is more verbose
        logger->set_level(std::min(console_level, file_sink_ptr->level()));
        logger->debug("Console log level set to {}", spdlog::level::to_string_view(console_level));
    }

    spdlog::level::level_enum level_from_string(const std::string& level_str) {
        std::string lower_str = level_str;
        std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(),
            [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        if (lower_str == "trace") return spdlog::level::trace;
        if (lower_str == "debug") return spdlog::level::debug;
        if (lower_str == "info") return spdlog::level::info;
        if (lower_str == "warn" || lower_str == "warning") return spdlog::level::warn;
        if (lower_str == "error" || lower_str == "err") return spdlog::level::err;
        if (lower_str == "critical" || lower_str == "crit") return spdlog::level::critical;
        if (lower_str == "off") return spdlog::level::off;
        std::cerr << "[Logging] Unrecognized log level '" << level_str << "', using 'info'." << std::endl;
        return spdlog::level::info;
    }

} // namespace logging
} // namespace core
