#include "ObstacleSpawner.h"

namespace DashSim {

ObstacleSpawner::ObstacleSpawner(const EpisodeConfig& config, uint32_t seed)
    : config_(config), rng_(seed), delayDist_(config.minSpawnDelay, config.maxSpawnDelay)
{
    nextSpawnDelay_ = drawDelay();
}

double ObstacleSpawner::drawDelay()
{
    // uniform_real_distribution requires a < b; a degenerate range is a fixed delay.
    if (config_.minSpawnDelay >= config_.maxSpawnDelay) {
        return config_.minSpawnDelay;
    }
    return delayDist_(rng_);
}

std::optional<Obstacle> ObstacleSpawner::update(double deltaTime)
{
    spawnTimer_ += deltaTime;
    if (spawnTimer_ < nextSpawnDelay_) {
        return std::nullopt;
    }

    spawnTimer_ = 0.0;
    nextSpawnDelay_ = drawDelay();
    spawnCount_++;

    Obstacle obstacle;
    obstacle.x = config_.playfieldWidth;
    obstacle.y = config_.playfieldHeight - config_.obstacleHeight;
    obstacle.width = config_.obstacleWidth;
    obstacle.height = config_.obstacleHeight;
    obstacle.speed = config_.obstacleSpeed;
    return obstacle;
}

} // namespace DashSim
