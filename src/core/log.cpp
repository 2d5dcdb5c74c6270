/// @file log.cpp
/// @brief Logger registry for relay_core
///
/// Every logger is created through one registry so a config change can
/// rebuild sinks and levels in place. Script loggers may be pinned to an
/// instance's own level.

#include <relay/core/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <array>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

namespace relay_core {

namespace {

constexpr const char* k_console_pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* k_file_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

class LoggerRegistry {
public:
    static LoggerRegistry& instance() {
        static LoggerRegistry registry;
        return registry;
    }

    std::shared_ptr<spdlog::logger> get(const std::string& name) {
        std::lock_guard lock(m_mutex);
        if (auto it = m_loggers.find(name); it != m_loggers.end()) {
            return it->second;
        }
        auto sinks = make_sinks(name);
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(m_config.level);
        m_loggers.emplace(name, logger);
        return logger;
    }

    void configure(const LogConfig& config) {
        std::lock_guard lock(m_mutex);
        m_config = config;
        for (auto& [name, logger] : m_loggers) {
            logger->sinks() = make_sinks(name);
            if (!m_pinned.contains(name)) {
                logger->set_level(m_config.level);
            }
        }
    }

    void set_level(spdlog::level::level_enum level) {
        std::lock_guard lock(m_mutex);
        m_config.level = level;
        for (auto& [name, logger] : m_loggers) {
            if (!m_pinned.contains(name)) {
                logger->set_level(level);
            }
        }
    }

    void pin(spdlog::logger& logger, spdlog::level::level_enum level) {
        std::lock_guard lock(m_mutex);
        m_pinned.insert(logger.name());
        logger.set_level(level);
    }

    void flush() {
        std::lock_guard lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
        }
    }

    void clear() {
        std::lock_guard lock(m_mutex);
        for (auto& [name, logger] : m_loggers) {
            logger->flush();
            logger->sinks().clear();
        }
        m_pinned.clear();
    }

private:
    LoggerRegistry() = default;

    std::vector<spdlog::sink_ptr> make_sinks(const std::string& name) const {
        std::vector<spdlog::sink_ptr> sinks;

        if (m_config.console_enabled) {
            auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console->set_pattern(k_console_pattern);
            sinks.push_back(std::move(console));
        }

        if (m_config.file_enabled && !m_config.log_directory.empty()) {
            // "script:main" -> "script_main.log"
            std::string file_name = name;
            std::replace(file_name.begin(), file_name.end(), ':', '_');
            auto path = std::filesystem::path(m_config.log_directory) / (file_name + ".log");
            try {
                std::filesystem::create_directories(m_config.log_directory);
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    path.string(), m_config.rotate_bytes, m_config.rotate_files);
                file->set_pattern(k_file_pattern);
                sinks.push_back(std::move(file));
            } catch (const spdlog::spdlog_ex& e) {
                spdlog::warn("No log file for '{}': {}", name, e.what());
            } catch (const std::filesystem::filesystem_error& e) {
                spdlog::warn("No log file for '{}': {}", name, e.what());
            }
        }

        return sinks;
    }

    std::mutex m_mutex;
    LogConfig m_config;
    std::map<std::string, std::shared_ptr<spdlog::logger>> m_loggers;
    std::set<std::string> m_pinned;
};

struct LevelName {
    const char* name;
    spdlog::level::level_enum level;
};

constexpr std::array<LevelName, 7> k_level_names{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

void init_logging() {
    LoggerRegistry::instance().configure(LogConfig{});
}

void configure_logging(const LogConfig& config) {
    LoggerRegistry::instance().configure(config);
}

void flush_all_loggers() {
    LoggerRegistry::instance().flush();
}

void shutdown_logging() {
    LoggerRegistry::instance().clear();
    spdlog::shutdown();
}

// =============================================================================
// Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> host_logger() {
    static auto logger = LoggerRegistry::instance().get("host");
    return logger;
}

std::shared_ptr<spdlog::logger> store_logger() {
    static auto logger = LoggerRegistry::instance().get("store");
    return logger;
}

std::shared_ptr<spdlog::logger> event_logger() {
    static auto logger = LoggerRegistry::instance().get("events");
    return logger;
}

std::shared_ptr<spdlog::logger> net_logger() {
    static auto logger = LoggerRegistry::instance().get("net");
    return logger;
}

std::shared_ptr<spdlog::logger> script_logger(const std::string& instance_id) {
    return LoggerRegistry::instance().get("script:" + instance_id);
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    LoggerRegistry::instance().set_level(level);
}

void pin_logger_level(spdlog::logger& logger, spdlog::level::level_enum level) {
    LoggerRegistry::instance().pin(logger, level);
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    for (const auto& entry : k_level_names) {
        if (str == entry.name) {
            return entry.level;
        }
    }
    return std::nullopt;
}

spdlog::level::level_enum level_from_verbosity(int verbosity) {
    switch (verbosity) {
        case 0: return spdlog::level::off;
        case 1: return spdlog::level::err;
        case 2: return spdlog::level::warn;
        case 3: return spdlog::level::info;
        default: break;
    }
    if (verbosity < 0) {
        return spdlog::level::off;
    }
    return verbosity >= 10 ? spdlog::level::trace : spdlog::level::debug;
}

int verbosity_from_level(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::off: return 0;
        case spdlog::level::critical:
        case spdlog::level::err: return 1;
        case spdlog::level::warn: return 2;
        case spdlog::level::info: return 3;
        case spdlog::level::debug: return 4;
        case spdlog::level::trace: return 10;
        default: return 3;
    }
}

} // namespace relay_core
