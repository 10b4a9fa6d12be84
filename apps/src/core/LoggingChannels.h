#pragma once

// Enable all log levels for SPDLOG_LOGGER_* macros (must be before spdlog includes).
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <cassert>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace DashSim {

/**
 * @brief Available logging channels for categorizing log messages.
 */
enum class LogChannel {
    Config,
    Evolution,
    Physics,
    State,
};

inline const char* toString(LogChannel channel)
{
    switch (channel) {
        case LogChannel::Config:
            return "config";
        case LogChannel::Evolution:
            return "evolution";
        case LogChannel::Physics:
            return "physics";
        case LogChannel::State:
            return "state";
    }
    assert(false && "Unhandled LogChannel in switch");
    return "";
}

/**
 * @brief Named loggers per subsystem sharing one console sink and one file sink.
 *
 * Lets a training run be debugged one concern at a time, e.g. per-step physics traces
 * without per-generation evolution chatter.
 */
class LoggingChannels {
public:
    /**
     * @brief Initialize the logging system with shared sinks.
     * @param consoleLevel Console sink level.
     * @param fileLevel File sink level.
     * @param componentName Prefix placed in the pattern (e.g. "cli", "tests").
     * @param consoleToStderr Send console output to stderr so stdout stays clean JSON.
     */
    static void initialize(
        spdlog::level::level_enum consoleLevel = spdlog::level::info,
        spdlog::level::level_enum fileLevel = spdlog::level::debug,
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    /**
     * @brief Initialize from a JSON config file.
     * Looks for <configPath>.local first, falls back to <configPath>. Missing or unreadable
     * files fall back to built-in defaults.
     * @return true if a config file was applied, false if defaults were used.
     */
    static bool initializeFromConfig(
        const std::string& configPath = "logging-config.json",
        const std::string& componentName = "default",
        bool consoleToStderr = false);

    static std::shared_ptr<spdlog::logger> get(LogChannel channel);

    /**
     * @brief Configure channel levels from a comma-separated list.
     * @param levels Format: "channel:level,channel2:level2" or "*:level" for all.
     * Examples:
     *   "physics:trace" - per-step physics tracing
     *   "*:warn,evolution:info" - only generation summaries
     */
    static void configureFromString(const std::string& levels);

    static void setChannelLevel(LogChannel channel, spdlog::level::level_enum level);
    static void setChannelLevel(const std::string& channel, spdlog::level::level_enum level);

    static spdlog::level::level_enum parseLevelString(const std::string& levelStr);

    // Console sink threshold, independent of the per-channel levels.
    static void setConsoleLevel(spdlog::level::level_enum level);

    // Drops every logger so the next initialize*() call starts clean.
    static void shutdown();

    static bool isInitialized() { return initialized_; }

private:
    struct Settings {
        spdlog::level::level_enum consoleLevel = spdlog::level::info;
        spdlog::level::level_enum fileLevel = spdlog::level::debug;
        std::string filePath;
        bool truncate = true;
        nlohmann::json channelLevels; // Channel name -> level string.
    };

    static Settings defaultSettings();
    static Settings parseSettings(const nlohmann::json& config, Settings settings);

    // Builds sinks and loggers. Caller holds the init lock.
    static void install(
        const Settings& settings, const std::string& componentName, bool consoleToStderr);

    static spdlog::sink_ptr makeConsoleSink(bool toStderr, spdlog::level::level_enum level);
    static std::string buildPattern(const std::string& componentName, bool includeChannel);

    static bool initialized_;
    static std::vector<spdlog::sink_ptr> sharedSinks_;
};

// Undefine any existing LOG_* macros pulled in by other headers.
#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#ifdef LOG_INFO
#undef LOG_INFO
#endif
#ifdef LOG_WARN
#undef LOG_WARN
#endif
#ifdef LOG_ERROR
#undef LOG_ERROR
#endif

#define LOG_TRACE(channel, ...) \
    SPDLOG_LOGGER_TRACE(::DashSim::LoggingChannels::get(::DashSim::LogChannel::channel), __VA_ARGS__)
#define LOG_DEBUG(channel, ...) \
    SPDLOG_LOGGER_DEBUG(::DashSim::LoggingChannels::get(::DashSim::LogChannel::channel), __VA_ARGS__)
#define LOG_INFO(channel, ...) \
    SPDLOG_LOGGER_INFO(::DashSim::LoggingChannels::get(::DashSim::LogChannel::channel), __VA_ARGS__)
#define LOG_WARN(channel, ...) \
    SPDLOG_LOGGER_WARN(::DashSim::LoggingChannels::get(::DashSim::LogChannel::channel), __VA_ARGS__)
#define LOG_ERROR(channel, ...) \
    SPDLOG_LOGGER_ERROR(::DashSim::LoggingChannels::get(::DashSim::LogChannel::channel), __VA_ARGS__)

// Simple logging macros using default logger (no channel parameter, omits channel in output).
#define SLOG_TRACE(...) SPDLOG_LOGGER_TRACE(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_INFO(...) SPDLOG_LOGGER_INFO(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_WARN(...) SPDLOG_LOGGER_WARN(spdlog::default_logger(), __VA_ARGS__)
#define SLOG_ERROR(...) SPDLOG_LOGGER_ERROR(spdlog::default_logger(), __VA_ARGS__)

} // namespace DashSim
