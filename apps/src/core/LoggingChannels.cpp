#include "LoggingChannels.h"
#include "Assert.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace DashSim {

namespace {
constexpr const char* kDefaultLogPath = "dashsim.log";

constexpr LogChannel kAllChannels[] = {
    LogChannel::Config,
    LogChannel::Evolution,
    LogChannel::Physics,
    LogChannel::State,
};

std::mutex& initMutex()
{
    static std::mutex mutex;
    return mutex;
}

std::string trim(const std::string& text)
{
    const size_t first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const size_t last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}
} // namespace

bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

LoggingChannels::Settings LoggingChannels::defaultSettings()
{
    Settings settings;
    settings.filePath = kDefaultLogPath;
    settings.channelLevels = {
        { "config", "info" },
        { "evolution", "info" },
        { "physics", "info" },
        { "state", "info" },
    };
    return settings;
}

LoggingChannels::Settings LoggingChannels::parseSettings(
    const nlohmann::json& config, Settings settings)
{
    if (config.contains("defaults")) {
        const auto& defaults = config.at("defaults");
        if (defaults.contains("console_level")) {
            settings.consoleLevel =
                parseLevelString(defaults.at("console_level").get<std::string>());
        }
        if (defaults.contains("file_level")) {
            settings.fileLevel = parseLevelString(defaults.at("file_level").get<std::string>());
        }
    }

    if (config.contains("sinks") && config.at("sinks").contains("file")) {
        const auto& file = config.at("sinks").at("file");
        settings.filePath = file.value("path", settings.filePath);
        settings.truncate = file.value("truncate", settings.truncate);
    }

    if (config.contains("channels")) {
        for (const auto& [name, level] : config.at("channels").items()) {
            settings.channelLevels[name] = level;
        }
    }
    return settings;
}

std::string LoggingChannels::buildPattern(const std::string& componentName, bool includeChannel)
{
    std::string pattern = "[%H:%M:%S.%e] ";
    if (componentName != "default" && !componentName.empty()) {
        pattern += "[" + componentName + "] ";
    }
    if (includeChannel) {
        pattern += "[%n] ";
    }
    return pattern + "[%^%l%$] [%s:%#] %v";
}

spdlog::sink_ptr LoggingChannels::makeConsoleSink(bool toStderr, spdlog::level::level_enum level)
{
    spdlog::sink_ptr sink;
    if (toStderr) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    else {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    sink->set_level(level);
    return sink;
}

void LoggingChannels::install(
    const Settings& settings, const std::string& componentName, bool consoleToStderr)
{
    // Channel loggers share one console sink and one file sink.
    auto fileSink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.filePath, settings.truncate);
    fileSink->set_level(settings.fileLevel);
    sharedSinks_ = { makeConsoleSink(consoleToStderr, settings.consoleLevel), fileSink };

    const std::string channelPattern = buildPattern(componentName, true);
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(channelPattern);
    }

    for (const LogChannel channel : kAllChannels) {
        const std::string name = toString(channel);
        auto level = spdlog::level::info;
        if (settings.channelLevels.contains(name) && settings.channelLevels[name].is_string()) {
            level = parseLevelString(settings.channelLevels[name].get<std::string>());
        }

        spdlog::drop(name);
        auto logger =
            std::make_shared<spdlog::logger>(name, sharedSinks_.begin(), sharedSinks_.end());
        logger->set_level(level);
        spdlog::register_logger(logger);
    }

    // The default logger gets its own sinks so its pattern omits the channel name. Its file
    // sink appends to the file the shared sink just opened.
    auto defaultFileSink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.filePath, false);
    defaultFileSink->set_level(settings.fileLevel);
    std::vector<spdlog::sink_ptr> defaultSinks = {
        makeConsoleSink(consoleToStderr, settings.consoleLevel),
        defaultFileSink,
    };
    const std::string defaultPattern = buildPattern(componentName, false);
    for (auto& sink : defaultSinks) {
        sink->set_pattern(defaultPattern);
    }

    const std::string loggerName = componentName.empty() ? "default" : componentName;
    spdlog::drop(loggerName);
    auto defaultLogger =
        std::make_shared<spdlog::logger>(loggerName, defaultSinks.begin(), defaultSinks.end());
    defaultLogger->set_level(spdlog::level::info);
    spdlog::set_default_logger(defaultLogger);

    spdlog::flush_every(std::chrono::seconds(1));
    initialized_ = true;
}

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName,
    bool consoleToStderr)
{
    {
        std::lock_guard<std::mutex> lock(initMutex());
        if (initialized_) {
            spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
            return;
        }

        Settings settings = defaultSettings();
        settings.consoleLevel = consoleLevel;
        settings.fileLevel = fileLevel;
        install(settings, componentName, consoleToStderr);
    }
    SLOG_DEBUG("LoggingChannels initialized");
}

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName, bool consoleToStderr)
{
    namespace fs = std::filesystem;

    std::error_code ec;
    std::string pathToUse;
    if (fs::is_regular_file(configPath + ".local", ec)) {
        pathToUse = configPath + ".local";
    }
    else if (fs::is_regular_file(configPath, ec)) {
        pathToUse = configPath;
    }

    Settings settings = defaultSettings();
    std::string problem;
    if (pathToUse.empty()) {
        problem = "not found";
    }
    else {
        try {
            std::ifstream file(pathToUse);
            if (!file.is_open()) {
                throw std::runtime_error("cannot open file");
            }
            settings = parseSettings(nlohmann::json::parse(file), settings);
        }
        catch (const std::exception& e) {
            problem = e.what();
            settings = defaultSettings();
        }
    }

    {
        std::lock_guard<std::mutex> lock(initMutex());
        if (initialized_) {
            spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
            return false;
        }
        install(settings, componentName, consoleToStderr);
    }

    if (!problem.empty()) {
        SLOG_DEBUG("Logging config {}: {}, using built-in defaults", configPath, problem);
        return false;
    }
    SLOG_INFO("Loaded logging config from {}", pathToUse);
    return true;
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Auto-initialize with defaults if get() is called before initialize().
    // This commonly happens in unit tests that use gtest_main.
    bool needsInit = false;
    {
        std::lock_guard<std::mutex> lock(initMutex());
        needsInit = !initialized_;
    }
    if (needsInit) {
        initialize();
    }

    auto logger = spdlog::get(toString(channel));
    DASHSIM_ASSERT(logger != nullptr, "LogChannel not registered after initialization");
    return logger;
}

void LoggingChannels::configureFromString(const std::string& levels)
{
    std::stringstream ss(levels);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) {
            continue;
        }

        const size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel level (missing colon): {}", item);
            continue;
        }

        const std::string channel = trim(item.substr(0, colonPos));
        const auto level = parseLevelString(trim(item.substr(colonPos + 1)));

        if (channel == "*") {
            spdlog::apply_all(
                [level](std::shared_ptr<spdlog::logger> logger) { logger->set_level(level); });
            spdlog::debug("Set all channels to level: {}", spdlog::level::to_string_view(level));
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    setChannelLevel(std::string(toString(channel)), level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Unknown log channel '{}'", channel);
        return;
    }
    logger->set_level(level);
    spdlog::debug("Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
}

void LoggingChannels::setConsoleLevel(spdlog::level::level_enum level)
{
    std::lock_guard<std::mutex> lock(initMutex());
    if (!initialized_) {
        return;
    }

    // Sink 0 is the console sink, both in the shared set and on the default logger.
    sharedSinks_.front()->set_level(level);
    if (auto defaultLogger = spdlog::default_logger()) {
        defaultLogger->sinks().front()->set_level(level);
    }
}

void LoggingChannels::shutdown()
{
    std::lock_guard<std::mutex> lock(initMutex());
    spdlog::drop_all();
    sharedSinks_.clear();
    initialized_ = false;
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "warning") {
        return spdlog::level::warn;
    }
    if (lower == "error") {
        return spdlog::level::err;
    }

    const auto level = spdlog::level::from_str(lower);
    if (level == spdlog::level::off && lower != "off") {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
    return level;
}

} // namespace DashSim
