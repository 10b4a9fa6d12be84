#include "EpisodeConfig.h"
#include "core/ReflectSerializer.h"

#include <cmath>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace DashSim {

namespace {
using ValidationResult = Result<std::monostate, std::string>;

ValidationResult requirePositive(const char* name, double value)
{
    if (!std::isfinite(value) || value <= 0.0) {
        return ValidationResult::error(
            fmt::format("episode.{} must be a positive finite number (got {})", name, value));
    }
    return ValidationResult::okay(std::monostate{});
}
} // namespace

Result<std::monostate, std::string> validate(const EpisodeConfig& config)
{
    const std::pair<const char*, double> positives[] = {
        { "playfieldWidth", config.playfieldWidth },
        { "playfieldHeight", config.playfieldHeight },
        { "timestep", config.timestep },
        { "maxTime", config.maxTime },
        { "agentWidth", config.agentWidth },
        { "agentHeight", config.agentHeight },
        { "obstacleWidth", config.obstacleWidth },
        { "obstacleHeight", config.obstacleHeight },
        { "obstacleSpeed", config.obstacleSpeed },
        { "minSpawnDelay", config.minSpawnDelay },
        { "maxSpawnDelay", config.maxSpawnDelay },
    };
    for (const auto& [name, value] : positives) {
        auto result = requirePositive(name, value);
        if (result.isError()) {
            return result;
        }
    }

    if (config.minSpawnDelay > config.maxSpawnDelay) {
        return ValidationResult::error(fmt::format(
            "episode.minSpawnDelay ({}) must not exceed episode.maxSpawnDelay ({})",
            config.minSpawnDelay,
            config.maxSpawnDelay));
    }
    if (!std::isfinite(config.gravity) || !std::isfinite(config.jumpImpulse)) {
        return ValidationResult::error("episode.gravity and episode.jumpImpulse must be finite");
    }
    if (!std::isfinite(config.agentSpawnClearance) || config.agentSpawnClearance < 0.0) {
        return ValidationResult::error("episode.agentSpawnClearance must be >= 0");
    }
    if (!std::isfinite(config.noObstacleDistance)) {
        return ValidationResult::error("episode.noObstacleDistance must be finite");
    }
    if (config.agentHeight + config.agentSpawnClearance > config.playfieldHeight) {
        return ValidationResult::error("episode: agent does not fit inside the playfield height");
    }

    return ValidationResult::okay(std::monostate{});
}

void to_json(nlohmann::json& j, const EpisodeConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, EpisodeConfig& config)
{
    ReflectSerializer::update_from_json(j, config);
}

} // namespace DashSim
