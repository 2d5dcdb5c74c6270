#pragma once

/// @file log.hpp
/// @brief spdlog loggers for relay subsystems and script instances

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

/// Process-level messages from the relay_host entry point
#define RELAY_LOG_INFO(...) ::relay_core::host_logger()->info(__VA_ARGS__)
#define RELAY_LOG_WARN(...) ::relay_core::host_logger()->warn(__VA_ARGS__)
#define RELAY_LOG_ERROR(...) ::relay_core::host_logger()->error(__VA_ARGS__)

namespace relay_core {

// =============================================================================
// Configuration
// =============================================================================

/// The "log" section of the host config
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t rotate_bytes = 10 * 1024 * 1024;
    std::size_t rotate_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Console-only logging at info, used until the config file has been read
void init_logging();

/// Apply a config before any worker thread logs; existing loggers get new sinks
void configure_logging(const LogConfig& config);

/// Flush every relay logger
void flush_all_loggers();

/// Drop every relay logger and shut spdlog down
void shutdown_logging();

// =============================================================================
// Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> host_logger();
std::shared_ptr<spdlog::logger> store_logger();
std::shared_ptr<spdlog::logger> event_logger();
std::shared_ptr<spdlog::logger> net_logger();

/// "script:<instance>"; shared by every script loaded into that instance
std::shared_ptr<spdlog::logger> script_logger(const std::string& instance_id);

// =============================================================================
// Levels
// =============================================================================

/// Level for all loggers that are not pinned
void set_global_log_level(spdlog::level::level_enum level);

/// Give one logger its own level; later global changes skip it
void pin_logger_level(spdlog::logger& logger, spdlog::level::level_enum level);

/// "trace", "debug", "info", "warn", "error", "critical" or "off"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Bot log levels run 0..11: 0 silent, 1 errors, 2 warnings, 3 info, 4..9 debug, 10+ trace
spdlog::level::level_enum level_from_verbosity(int verbosity);

/// Lowest verbosity that maps back to the level
int verbosity_from_level(spdlog::level::level_enum level);

} // namespace relay_core
