#pragma once

#include "core/Result.h"

#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace DashSim {

/**
 * Playfield geometry and physics constants for one episode.
 *
 * Defaults: an 800x450 playfield stepped at 60 Hz, gravity 981 px/s^2, a -500 px/s jump,
 * 25x25 obstacles at 250 px/s spawned every 0.8-2.5 s.
 */
struct EpisodeConfig {
    // Playfield. Used for normalization and spawn geometry only.
    double playfieldWidth = 800.0;
    double playfieldHeight = 450.0;

    // Fixed timestep and hard cap on simulated time.
    double timestep = 1.0 / 60.0;
    double maxTime = 30.0;

    // Agent.
    double gravity = 981.0;      // px/s^2, positive is down.
    double jumpImpulse = -500.0; // px/s, applied as an instantaneous velocity.
    double agentWidth = 20.0;
    double agentHeight = 20.0;
    double agentSpawnClearance = 10.0; // Gap between agent and ground at spawn.

    // Obstacles.
    double obstacleWidth = 25.0;
    double obstacleHeight = 25.0;
    double obstacleSpeed = 250.0; // px/s, leftward.
    double minSpawnDelay = 0.8;
    double maxSpawnDelay = 2.5;

    // Raw distance reported when nothing is ahead; saturates the normalized input at 1.
    double noObstacleDistance = 999.0;
};

Result<std::monostate, std::string> validate(const EpisodeConfig& config);

void to_json(nlohmann::json& j, const EpisodeConfig& config);
void from_json(const nlohmann::json& j, EpisodeConfig& config);

} // namespace DashSim
