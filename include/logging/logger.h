/**
 * @file logger.h
 * @brief Logging facade for live_scribe
 *
 * Thin wrapper over spdlog. Console and rotating-file sinks, level control,
 * and macros so call sites never touch spdlog directly.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace live_scribe {
namespace logging {

enum class LogLevel : std::uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath = "";                                   // Empty = no file output
    size_t maxFileSize = static_cast<size_t>(5 * 1024 * 1024);  // 5 MB
    size_t maxBackups = 3;
    bool consoleOutput = true;
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
};

/**
 * @brief Initialize the logging system
 *
 * Replaces the stderr logger from initializeEarly(). Calling again after that only
 * updates level and pattern.
 *
 * @return true if initialization succeeded
 */
bool initialize(const LogConfig& config = LogConfig{});

/**
 * @brief Stderr-only initialization used before the config file has been read
 */
bool initializeEarly();

/**
 * @brief Initialize from the "logging" section of a JSON config file
 *
 * A missing file or section falls back to defaults. The LIVE_SCRIBE_LOG_LEVEL
 * environment variable, when set, overrides the configured level.
 */
bool initializeFromConfig(const std::string& configPath);

void shutdown();

void setLevel(LogLevel level);
LogLevel getLevel();

void flush();

/**
 * @brief Underlying spdlog logger (lazily initialized with defaults)
 */
std::shared_ptr<spdlog::logger> getLogger();

std::string_view levelToString(LogLevel level);

/**
 * @brief Case-insensitive level parse; unknown names map to Info
 */
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace live_scribe

#include <spdlog/spdlog.h>

#define LIVE_SCRIBE_LOG_AT(spdlog_macro, ...)                \
    do {                                                    \
        auto ls_logger_ = live_scribe::logging::getLogger(); \
        if (ls_logger_)                                     \
            spdlog_macro(ls_logger_, __VA_ARGS__);          \
    } while (0)

#define LOG_TRACE(...) LIVE_SCRIBE_LOG_AT(SPDLOG_LOGGER_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) LIVE_SCRIBE_LOG_AT(SPDLOG_LOGGER_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) LIVE_SCRIBE_LOG_AT(SPDLOG_LOGGER_INFO, __VA_ARGS__)
#define LOG_WARN(...) LIVE_SCRIBE_LOG_AT(SPDLOG_LOGGER_WARN, __VA_ARGS__)
#define LOG_ERROR(...) LIVE_SCRIBE_LOG_AT(SPDLOG_LOGGER_ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) LIVE_SCRIBE_LOG_AT(SPDLOG_LOGGER_CRITICAL, __VA_ARGS__)

// Skips formatting entirely when the condition is false.
#define LOG_IF(level, condition, ...) \
    do {                              \
        if (condition)                \
            LOG_##level(__VA_ARGS__); \
    } while (0)

// Rate limiter for capture-path warnings.
#define LOG_EVERY_N(level, n, ...)                            \
    do {                                                      \
        static std::atomic<uint64_t> log_count_##__LINE__{0}; \
        if (log_count_##__LINE__.fetch_add(1) % (n) == 0) {   \
            LOG_##level(__VA_ARGS__);                         \
        }                                                     \
    } while (0)

#define LOG_ONCE(level, ...)                                             \
    do {                                                                 \
        static std::atomic<bool> logged_##__LINE__{false};               \
        bool expected = false;                                           \
        if (logged_##__LINE__.compare_exchange_strong(expected, true)) { \
            LOG_##level(__VA_ARGS__);                                    \
        }                                                                \
    } while (0)
