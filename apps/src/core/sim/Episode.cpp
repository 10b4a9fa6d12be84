#include "Episode.h"
#include "core/LoggingChannels.h"
#include "core/ReflectSerializer.h"

#include <algorithm>

namespace DashSim {

const char* toString(EpisodeState state)
{
    switch (state) {
        case EpisodeState::Running:
            return "Running";
        case EpisodeState::Collided:
            return "Collided";
        case EpisodeState::TimeExpired:
            return "TimeExpired";
    }
    return "Unknown";
}

void to_json(nlohmann::json& j, const EpisodeResult& result)
{
    j = ReflectSerializer::to_json(result);
}

Episode::Episode(const Genome& policy, const EpisodeConfig& config, uint32_t spawnSeed)
    : config_(config),
      brain_(policy),
      agent_(Agent::spawn(config)),
      spawner_(config, spawnSeed)
{}

EpisodeState Episode::step()
{
    if (isOver()) {
        return state_;
    }

    const double dt = config_.timestep;
    jumpedLastStep_ = false;

    elapsed_ += dt;
    steps_++;

    agent_.applyPhysics(dt, config_.gravity, getGroundY());

    lastSensory_ = gatherSensoryData(agent_, obstacles_, config_);
    if (agent_.grounded && brain_.wantsJump(lastSensory_)) {
        agent_.jump(config_.jumpImpulse);
        jumpedLastStep_ = true;
        jumps_++;
    }

    if (auto spawned = spawner_.update(dt)) {
        LOG_TRACE(
            Physics,
            "Episode: obstacle {} spawned at t={:.3f}, next in {:.3f}s",
            spawner_.getSpawnCount(),
            elapsed_,
            spawner_.getNextSpawnDelay());
        obstacles_.push_back(*spawned);
    }

    updateObstacles();

    if (detectCollision()) {
        state_ = EpisodeState::Collided;
        LOG_TRACE(Physics, "Episode: collision at t={:.3f} after {} jumps", elapsed_, jumps_);
    }
    else if (elapsed_ >= config_.maxTime) {
        state_ = EpisodeState::TimeExpired;
    }

    return state_;
}

void Episode::updateObstacles()
{
    for (auto& obstacle : obstacles_) {
        obstacle.update(config_.timestep);
    }

    const auto firstRemoved =
        std::remove_if(obstacles_.begin(), obstacles_.end(), [](const Obstacle& o) {
            return o.isOffScreen();
        });
    obstaclesCleared_ += static_cast<int>(std::distance(firstRemoved, obstacles_.end()));
    obstacles_.erase(firstRemoved, obstacles_.end());
}

bool Episode::detectCollision() const
{
    const Aabb agentBox = agent_.bounds();
    return std::any_of(obstacles_.begin(), obstacles_.end(), [&agentBox](const Obstacle& o) {
        return overlaps(agentBox, o.bounds());
    });
}

EpisodeResult Episode::run(const StepObserver& observer)
{
    while (!isOver()) {
        step();
        if (observer) {
            observer(*this);
        }
    }
    return getResult();
}

EpisodeResult Episode::getResult() const
{
    return EpisodeResult{
        .survivalTime = elapsed_,
        .terminated = state_ == EpisodeState::Collided,
        .endState = state_,
        .steps = steps_,
        .jumps = jumps_,
        .obstaclesSpawned = spawner_.getSpawnCount(),
        .obstaclesCleared = obstaclesCleared_,
    };
}

EpisodeResult runEpisode(
    const Genome& policy,
    const EpisodeConfig& config,
    uint32_t spawnSeed,
    const Episode::StepObserver& observer)
{
    Episode episode(policy, config, spawnSeed);
    return episode.run(observer);
}

Result<EpisodeResult, std::string> simulate(
    const Genome& policy,
    const EpisodeConfig& config,
    uint32_t spawnSeed,
    const Episode::StepObserver& observer)
{
    auto valid = validate(config);
    if (valid.isError()) {
        return Result<EpisodeResult, std::string>::error(valid.errorValue());
    }
    return Result<EpisodeResult, std::string>::okay(
        runEpisode(policy, config, spawnSeed, observer));
}

} // namespace DashSim
