/**
 * @file logger.cpp
 * @brief spdlog-backed implementation of the live_scribe logging facade
 */

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace live_scribe {
namespace logging {

namespace {

constexpr const char* kLoggerName = "live_scribe";
constexpr const char* kLevelEnvVar = "LIVE_SCRIBE_LOG_LEVEL";

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};
bool g_earlyOnly = false;  // stderr logger from initializeEarly(), replaced by initialize()

struct LevelEntry {
    LogLevel level;
    spdlog::level::level_enum spd;
    std::string_view name;
};

// Ordered by LogLevel
constexpr LevelEntry kLevels[] = {
    {LogLevel::Trace, spdlog::level::trace, "trace"},
    {LogLevel::Debug, spdlog::level::debug, "debug"},
    {LogLevel::Info, spdlog::level::info, "info"},
    {LogLevel::Warn, spdlog::level::warn, "warn"},
    {LogLevel::Error, spdlog::level::err, "error"},
    {LogLevel::Critical, spdlog::level::critical, "critical"},
    {LogLevel::Off, spdlog::level::off, "off"},
};

const LevelEntry& entryFor(LogLevel level) {
    const auto idx = static_cast<size_t>(level);
    return idx < std::size(kLevels) ? kLevels[idx] : kLevels[2];
}

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    return entryFor(level).spd;
}

LogLevel fromSpdlogLevel(spdlog::level::level_enum level) {
    for (const auto& entry : kLevels) {
        if (entry.spd == level) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

// Sinks accept every level; only the logger level filters
spdlog::sink_ptr makeConsoleSink(bool colored) {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    if (!colored) {
        sink->set_color_mode(spdlog::color_mode::never);
    }
    sink->set_level(spdlog::level::trace);
    return sink;
}

bool installLogger(std::vector<spdlog::sink_ptr> sinks, const LogConfig& config) {
    g_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    g_logger->set_level(toSpdlogLevel(config.level));
    g_logger->set_pattern(config.pattern);
    spdlog::set_default_logger(g_logger);
    g_logger->flush_on(spdlog::level::err);
    g_initialized.store(true, std::memory_order_release);
    return true;
}

}  // namespace

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_initialized.load(std::memory_order_acquire) && !g_earlyOnly) {
        if (g_logger) {
            g_logger->set_level(toSpdlogLevel(config.level));
            g_logger->set_pattern(config.pattern);
        }
        return true;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (config.consoleOutput) {
            sinks.push_back(makeConsoleSink(config.coloredOutput));
        }
        if (!config.filePath.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxBackups));
        }

        installLogger(std::move(sinks), config);
        g_earlyOnly = false;

        LOG_INFO("Logging initialized (level={})", levelToString(config.level));
        if (!config.filePath.empty()) {
            LOG_INFO("Log file: {} (max {}MB x {} backups)", config.filePath,
                     config.maxFileSize / (1024 * 1024), config.maxBackups);
        }
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

bool initializeEarly() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (g_initialized.load(std::memory_order_acquire)) {
        return true;
    }
    try {
        LogConfig config;
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        g_earlyOnly = true;
        return installLogger(std::move(sinks), config);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Early logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

bool initializeFromConfig(const std::string& configPath) {
    LogConfig config;

    std::ifstream file(configPath);
    if (file.is_open()) {
        try {
            nlohmann::json root;
            file >> root;
            auto it = root.find("logging");
            if (it != root.end() && it->is_object()) {
                const nlohmann::json& section = *it;
                config.level = stringToLevel(
                    section.value("level", std::string(levelToString(config.level))));
                config.filePath = section.value("filePath", config.filePath);
                config.maxFileSize = section.value("maxFileSize", config.maxFileSize);
                config.maxBackups = section.value("maxBackups", config.maxBackups);
                config.consoleOutput = section.value("consoleOutput", config.consoleOutput);
                config.coloredOutput = section.value("coloredOutput", config.coloredOutput);
                config.pattern = section.value("pattern", config.pattern);
            }
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << "Failed to parse logging config " << configPath << ": " << ex.what()
                      << std::endl;
            config = LogConfig{};
        }
    }

    if (const char* env = std::getenv(kLevelEnvVar)) {
        config.level = stringToLevel(env);
    }

    return initialize(config);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_logger) {
        LOG_INFO("Logging shutdown");
        g_logger->flush();
    }

    g_initialized.store(false, std::memory_order_release);
    g_earlyOnly = false;
    spdlog::shutdown();
    g_logger.reset();
}

void setLevel(LogLevel level) {
    if (g_logger) {
        g_logger->set_level(toSpdlogLevel(level));
        LOG_INFO("Log level changed to {}", levelToString(level));
    }
}

LogLevel getLevel() {
    if (g_logger) {
        return fromSpdlogLevel(g_logger->level());
    }
    return LogLevel::Info;
}

void flush() {
    if (g_logger) {
        g_logger->flush();
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (g_initialized.load(std::memory_order_acquire)) {
        return g_logger;
    }
    initialize();
    return g_logger;
}

std::string_view levelToString(LogLevel level) {
    return entryFor(level).name;
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "warning") {
        return LogLevel::Warn;
    }
    if (lower == "err") {
        return LogLevel::Error;
    }
    if (lower == "fatal") {
        return LogLevel::Critical;
    }
    if (lower == "none") {
        return LogLevel::Off;
    }
    for (const auto& entry : kLevels) {
        if (entry.name == lower) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace live_scribe
