#pragma once

#include "Agent.h"
#include "EpisodeConfig.h"
#include "Obstacle.h"
#include "ObstacleSpawner.h"
#include "SensoryData.h"
#include "core/Result.h"
#include "core/brains/LinearBrain.h"

#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace DashSim {

enum class EpisodeState : uint8_t {
    Running,
    Collided,
    TimeExpired,
};

const char* toString(EpisodeState state);

struct EpisodeResult {
    double survivalTime = 0.0; // Fitness signal.
    bool terminated = false;   // True when the agent hit an obstacle.
    EpisodeState endState = EpisodeState::Running;
    int steps = 0;
    int jumps = 0;
    int obstaclesSpawned = 0;
    int obstaclesCleared = 0;
};

void to_json(nlohmann::json& j, const EpisodeResult& result);

/**
 * One agent, one policy, one bounded run against scrolling obstacles.
 *
 * Each step() advances exactly one fixed timestep so callers can observe or render between
 * steps. The episode ends on the first collision or once elapsed time reaches maxTime.
 *
 * The config must already be validated; simulate() does that for one-off runs.
 */
class Episode {
public:
    // Called after every step. Presentation hook only; it sees a const episode.
    using StepObserver = std::function<void(const Episode&)>;

    Episode(const Genome& policy, const EpisodeConfig& config, uint32_t spawnSeed);

    EpisodeState step();
    EpisodeResult run(const StepObserver& observer = {});

    EpisodeResult getResult() const;
    EpisodeState getState() const { return state_; }
    bool isOver() const { return state_ != EpisodeState::Running; }

    double getElapsedTime() const { return elapsed_; }
    int getStepCount() const { return steps_; }
    const Agent& getAgent() const { return agent_; }
    const std::vector<Obstacle>& getObstacles() const { return obstacles_; }
    const SensoryData& getLastSensoryData() const { return lastSensory_; }
    bool didJumpLastStep() const { return jumpedLastStep_; }
    const EpisodeConfig& getConfig() const { return config_; }
    const Genome& getPolicy() const { return brain_.getGenome(); }

    double getGroundY() const { return config_.playfieldHeight - agent_.height; }

private:
    void updateObstacles();
    bool detectCollision() const;

    EpisodeConfig config_;
    LinearBrain brain_;
    Agent agent_;
    ObstacleSpawner spawner_;
    std::vector<Obstacle> obstacles_;
    SensoryData lastSensory_;

    EpisodeState state_ = EpisodeState::Running;
    double elapsed_ = 0.0;
    int steps_ = 0;
    int jumps_ = 0;
    int obstaclesCleared_ = 0;
    bool jumpedLastStep_ = false;
};

// Runs an episode to completion. The config must be valid.
EpisodeResult runEpisode(
    const Genome& policy,
    const EpisodeConfig& config,
    uint32_t spawnSeed,
    const Episode::StepObserver& observer = {});

// Validates the config, then runs an episode to completion.
Result<EpisodeResult, std::string> simulate(
    const Genome& policy,
    const EpisodeConfig& config,
    uint32_t spawnSeed,
    const Episode::StepObserver& observer = {});

} // namespace DashSim
