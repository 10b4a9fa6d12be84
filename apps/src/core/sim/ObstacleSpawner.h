#pragma once

#include "EpisodeConfig.h"
#include "Obstacle.h"

#include <cstdint>
#include <optional>
#include <random>

namespace DashSim {

/**
 * Spawns obstacles at the right edge after random delays.
 *
 * Owns its random stream so episodes never share generator state.
 */
class ObstacleSpawner {
public:
    ObstacleSpawner(const EpisodeConfig& config, uint32_t seed);

    // Advances the spawn timer and returns a new obstacle when the delay has elapsed.
    std::optional<Obstacle> update(double deltaTime);

    double getSpawnTimer() const { return spawnTimer_; }
    double getNextSpawnDelay() const { return nextSpawnDelay_; }
    int getSpawnCount() const { return spawnCount_; }

private:
    double drawDelay();

    EpisodeConfig config_;
    std::mt19937 rng_;
    std::uniform_real_distribution<double> delayDist_;
    double spawnTimer_ = 0.0;
    double nextSpawnDelay_ = 0.0;
    int spawnCount_ = 0;
};

} // namespace DashSim
