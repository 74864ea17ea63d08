/**
 * @file logger.h
 * @brief Logging for the remote control daemon
 *
 * The daemon logs through one spdlog logger named "camilla_remote". Startup
 * runs in two phases: initializeEarly() gives a stderr logger so option and
 * config errors are visible, then initializeFromConfig() replaces it with the
 * sinks described by the "logging" section of the daemon config file.
 *
 * Sinks never filter on their own; the logger level alone decides, so a
 * --log-level override after initialization takes effect on every sink.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

namespace camilla_remote {
namespace logging {

enum class LogLevel : std::uint8_t { Trace, Debug, Info, Warn, Error, Critical, Off };

/**
 * @brief The "logging" section of the daemon config file
 *
 * Field names match the JSON keys.
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string filePath;  // empty: no file output
    std::size_t maxFileSize = static_cast<std::size_t>(10 * 1024 * 1024);
    std::size_t maxBackups = 3;
    bool consoleOutput = true;  // stderr
    bool coloredOutput = true;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

/**
 * @brief Read the "logging" section of a config file
 *
 * A missing file or section gives the defaults. A malformed section is
 * reported on stderr and also gives the defaults, so a bad logging block
 * never keeps the daemon from starting.
 */
LogConfig loadLogConfig(const std::string& configPath);

/**
 * @brief Install the configured sinks
 *
 * Replaces the early stderr logger. Calling it again once initialized only
 * changes the level and pattern.
 */
bool initialize(const LogConfig& config = LogConfig{});

/// stderr-only logger for the time before the config file is read.
bool initializeEarly();

bool initializeFromConfig(const std::string& configPath);

/// Flushes and drops the logger; the next LOG_* call starts a default one.
void shutdown();

void setLevel(LogLevel level);

std::shared_ptr<spdlog::logger> getLogger();

/**
 * @brief Parse a level name (case-insensitive)
 *
 * Accepts the names --log-level documents plus "warning", "err", "fatal" and
 * "none". Anything else maps to Info.
 */
LogLevel stringToLevel(std::string_view str);

}  // namespace logging
}  // namespace camilla_remote

#include <spdlog/spdlog.h>

#define CAMILLA_REMOTE_LOG(spdlogMacro, ...)                    \
    do {                                                        \
        auto logger = camilla_remote::logging::getLogger();     \
        if (logger)                                             \
            spdlogMacro(logger, __VA_ARGS__);                   \
    } while (0)

#define LOG_TRACE(...) CAMILLA_REMOTE_LOG(SPDLOG_LOGGER_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) CAMILLA_REMOTE_LOG(SPDLOG_LOGGER_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) CAMILLA_REMOTE_LOG(SPDLOG_LOGGER_INFO, __VA_ARGS__)
#define LOG_WARN(...) CAMILLA_REMOTE_LOG(SPDLOG_LOGGER_WARN, __VA_ARGS__)
#define LOG_ERROR(...) CAMILLA_REMOTE_LOG(SPDLOG_LOGGER_ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) CAMILLA_REMOTE_LOG(SPDLOG_LOGGER_CRITICAL, __VA_ARGS__)
