/**
 * @file logger.cpp
 * @brief spdlog sinks and the config-driven setup of the daemon logger
 */

#include "logging/logger.h"

#include <atomic>
#include <cctype>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace camilla_remote {
namespace logging {

namespace {

constexpr const char* kLoggerName = "camilla_remote";

std::shared_ptr<spdlog::logger> g_logger;
std::mutex g_init_mutex;
std::atomic<bool> g_initialized{false};

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return spdlog::level::trace;
    case LogLevel::Debug:
        return spdlog::level::debug;
    case LogLevel::Info:
        return spdlog::level::info;
    case LogLevel::Warn:
        return spdlog::level::warn;
    case LogLevel::Error:
        return spdlog::level::err;
    case LogLevel::Critical:
        return spdlog::level::critical;
    case LogLevel::Off:
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

void install(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level,
             const std::string& pattern) {
    logger->set_level(level);
    logger->set_pattern(pattern);
    logger->flush_on(spdlog::level::err);
    spdlog::set_default_logger(logger);
    g_logger = std::move(logger);
}

}  // namespace

LogConfig loadLogConfig(const std::string& configPath) {
    LogConfig config;
    std::ifstream file(configPath);
    if (!file.is_open()) {
        return config;
    }

    try {
        nlohmann::json root;
        file >> root;
        if (!root.is_object() || !root.contains("logging")) {
            return config;
        }
        const auto& section = root.at("logging");
        LogConfig parsed;
        if (section.contains("level")) {
            parsed.level = stringToLevel(section.at("level").get<std::string>());
        }
        if (section.contains("filePath")) {
            parsed.filePath = section.at("filePath").get<std::string>();
        }
        if (section.contains("maxFileSize")) {
            parsed.maxFileSize = section.at("maxFileSize").get<std::size_t>();
        }
        if (section.contains("maxBackups")) {
            parsed.maxBackups = section.at("maxBackups").get<std::size_t>();
        }
        if (section.contains("consoleOutput")) {
            parsed.consoleOutput = section.at("consoleOutput").get<bool>();
        }
        if (section.contains("coloredOutput")) {
            parsed.coloredOutput = section.at("coloredOutput").get<bool>();
        }
        if (section.contains("pattern")) {
            parsed.pattern = section.at("pattern").get<std::string>();
        }
        config = parsed;
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "Ignoring logging section of " << configPath << ": " << ex.what()
                  << std::endl;
    }
    return config;
}

bool initialize(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_initialized.load(std::memory_order_acquire)) {
        if (g_logger) {
            g_logger->set_level(toSpdlogLevel(config.level));
            g_logger->set_pattern(config.pattern);
        }
        return true;
    }

    try {
        std::vector<spdlog::sink_ptr> sinks;
        if (config.consoleOutput) {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            if (!config.coloredOutput) {
                console->set_color_mode(spdlog::color_mode::never);
            }
            sinks.push_back(console);
        }
        if (!config.filePath.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxBackups));
        }

        install(std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end()),
                toSpdlogLevel(config.level), config.pattern);
        g_initialized.store(true, std::memory_order_release);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        return false;
    }

    if (!config.filePath.empty()) {
        LOG_INFO("Logging to {} (max {} bytes x {} backups)", config.filePath,
                 config.maxFileSize, config.maxBackups);
    }
    return true;
}

bool initializeEarly() {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_initialized.load(std::memory_order_acquire)) {
        return true;
    }

    try {
        // g_initialized stays false so initialize() swaps in the configured sinks
        install(std::make_shared<spdlog::logger>(
                    kLoggerName, std::make_shared<spdlog::sinks::stderr_color_sink_mt>()),
                spdlog::level::info, LogConfig{}.pattern);
        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Early logger initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

bool initializeFromConfig(const std::string& configPath) {
    return initialize(loadLogConfig(configPath));
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_logger) {
        g_logger->flush();
    }
    g_initialized.store(false, std::memory_order_release);
    spdlog::shutdown();
    g_logger.reset();
}

void setLevel(LogLevel level) {
    auto logger = getLogger();
    if (logger) {
        logger->set_level(toSpdlogLevel(level));
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (g_initialized.load(std::memory_order_acquire)) {
        return g_logger;
    }
    {
        std::lock_guard<std::mutex> lock(g_init_mutex);
        if (g_logger) {
            return g_logger;
        }
    }
    initialize();
    return g_logger;
}

LogLevel stringToLevel(std::string_view str) {
    std::string lower;
    lower.reserve(str.size());
    for (char c : str) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error" || lower == "err")
        return LogLevel::Error;
    if (lower == "critical" || lower == "fatal")
        return LogLevel::Critical;
    if (lower == "off" || lower == "none")
        return LogLevel::Off;
    return LogLevel::Info;
}

}  // namespace logging
}  // namespace camilla_remote
