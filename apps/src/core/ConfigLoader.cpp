#include "ConfigLoader.h"
#include "LoggingChannels.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace DashSim {

namespace {
constexpr const char* kConfigDirEnv = "DASHSIM_CONFIG_DIR";
constexpr const char* kLocalSuffix = ".local";

bool isBlank(const std::string& text)
{
    return std::all_of(
        text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}
} // namespace

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_ = std::nullopt;
}

std::vector<std::filesystem::path> ConfigLoader::getSearchPaths()
{
    namespace fs = std::filesystem;
    std::vector<fs::path> paths;

    if (explicitConfigDir_.has_value()) {
        paths.emplace_back(explicitConfigDir_.value());
    }
    if (const char* envDir = std::getenv(kConfigDirEnv); envDir && *envDir) {
        paths.emplace_back(envDir);
    }

    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (!ec) {
        paths.push_back(cwd / "config");
    }

    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "dashsim");
    }
    paths.emplace_back("/etc/dashsim");

    return paths;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    namespace fs = std::filesystem;

    for (const auto& dir : getSearchPaths()) {
        for (const fs::path candidate : { dir / (filename + kLocalSuffix), dir / filename }) {
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::readJsonFile(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        const std::string error = "Cannot open config file: " + path.string();
        LOG_WARN(Config, "ConfigLoader: {}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    const std::string text = buffer.str();
    if (isBlank(text)) {
        const std::string error = "Empty config file: " + path.string();
        LOG_WARN(Config, "ConfigLoader: {}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }

    LOG_INFO(Config, "ConfigLoader: Loading config from {}", path.string());
    return parseJsonText(text, path.string());
}

Result<nlohmann::json, std::string> ConfigLoader::parseJsonText(
    const std::string& text, const std::string& source)
{
    try {
        return Result<nlohmann::json, std::string>::okay(
            nlohmann::json::parse(text, nullptr, true, /*ignore_comments=*/true));
    }
    catch (const nlohmann::json::parse_error& e) {
        const std::string error = "Parse error in " + source + ": " + e.what();
        LOG_ERROR(Config, "ConfigLoader: {}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }
}

} // namespace DashSim
