#pragma once

#include <vector>

namespace DashSim {

struct Agent;
struct EpisodeConfig;
struct Obstacle;

/**
 * What the brain sees each step: how far the next obstacle is and how high the agent is,
 * both normalized by the playfield size.
 */
struct SensoryData {
    double rawDistance = 0.0;
    double normalizedDistance = 1.0; // [0, 1].
    double normalizedHeight = 0.0;   // agent.y / playfieldHeight.
    bool obstacleAhead = false;
};

// The next obstacle is the first one (in spawn order) whose right edge is past agent.x.
SensoryData gatherSensoryData(
    const Agent& agent, const std::vector<Obstacle>& obstacles, const EpisodeConfig& config);

} // namespace DashSim
