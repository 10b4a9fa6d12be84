#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace DashSim {

/**
 * @brief Locates JSON config files and converts them into the config aggregates.
 *
 * Directories are searched in this order and the first hit wins:
 * 1. The directory passed to setConfigDir() (the CLI's --config-dir).
 * 2. $DASHSIM_CONFIG_DIR.
 * 3. ./config/
 * 4. ~/.config/dashsim/
 * 5. /etc/dashsim/
 *
 * Inside a directory <name>.local shadows <name> completely (no merging). Files may contain
 * // and C-style comments. A document is applied on top of the type's defaults, so it only has
 * to name the keys it changes.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    // Error when no file is found or the file is broken.
    template <typename T>
    static Result<T, std::string> load(const std::string& filename);

    // Falls back to `defaults` when no file exists; a broken file is still an error.
    template <typename T>
    static Result<T, std::string> loadOrDefault(const std::string& filename, const T& defaults);

    // Parses an inline JSON document (e.g. a CLI argument) on top of a base value.
    template <typename T>
    static Result<T, std::string> parseOverride(const std::string& text, const T& base);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    static std::optional<std::string> explicitConfigDir_;

    static Result<nlohmann::json, std::string> readJsonFile(const std::filesystem::path& path);
    static Result<nlohmann::json, std::string> parseJsonText(
        const std::string& text, const std::string& source);

    template <typename T>
    static Result<T, std::string> convert(
        const nlohmann::json& json, T config, const std::string& source);
};

template <typename T>
Result<T, std::string> ConfigLoader::convert(
    const nlohmann::json& json, T config, const std::string& source)
{
    if (!json.is_object()) {
        return Result<T, std::string>::error(
            source + " must hold a JSON object, got " + json.type_name());
    }
    try {
        // Unqualified call so ADL finds the type's from_json.
        from_json(json, config);
        return Result<T, std::string>::okay(std::move(config));
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error("Failed to parse " + source + ": " + e.what());
    }
}

template <typename T>
Result<T, std::string> ConfigLoader::load(const std::string& filename)
{
    const auto path = findConfigFile(filename);
    if (!path.has_value()) {
        return Result<T, std::string>::error("Config file not found: " + filename);
    }

    auto json = readJsonFile(path.value());
    if (json.isError()) {
        return Result<T, std::string>::error(json.errorValue());
    }
    return convert<T>(json.value(), T{}, path->string());
}

template <typename T>
Result<T, std::string> ConfigLoader::loadOrDefault(const std::string& filename, const T& defaults)
{
    const auto path = findConfigFile(filename);
    if (!path.has_value()) {
        return Result<T, std::string>::okay(defaults);
    }

    auto json = readJsonFile(path.value());
    if (json.isError()) {
        return Result<T, std::string>::error(json.errorValue());
    }
    return convert<T>(json.value(), defaults, path->string());
}

template <typename T>
Result<T, std::string> ConfigLoader::parseOverride(const std::string& text, const T& base)
{
    auto json = parseJsonText(text, "inline config");
    if (json.isError()) {
        return Result<T, std::string>::error(json.errorValue());
    }
    return convert<T>(json.value(), base, "inline config");
}

} // namespace DashSim
