#include "SensoryData.h"
#include "Agent.h"
#include "EpisodeConfig.h"
#include "Obstacle.h"

#include <algorithm>

namespace DashSim {

SensoryData gatherSensoryData(
    const Agent& agent, const std::vector<Obstacle>& obstacles, const EpisodeConfig& config)
{
    SensoryData data;

    const auto next = std::find_if(obstacles.begin(), obstacles.end(), [&agent](const auto& o) {
        return o.x + o.width > agent.x;
    });

    if (next != obstacles.end()) {
        data.rawDistance = next->x - agent.x;
        data.obstacleAhead = true;
    }
    else {
        data.rawDistance = config.noObstacleDistance;
    }

    data.normalizedDistance = std::clamp(data.rawDistance / config.playfieldWidth, 0.0, 1.0);
    data.normalizedHeight = agent.y / config.playfieldHeight;
    return data;
}

} // namespace DashSim
