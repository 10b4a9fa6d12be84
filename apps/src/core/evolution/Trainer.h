#pragma once

#include "EvaluationPool.h"
#include "FitnessRecord.h"
#include "Generation.h"
#include "TrainingConfig.h"
#include "core/Result.h"
#include "core/brains/Genome.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace DashSim {

struct GenerationStats {
    int generation = 0;
    double bestFitness = 0.0;
    double averageFitness = 0.0;
    double worstFitness = 0.0;
};

struct TrainingResult {
    Genome bestGenome; // Best policy seen in any generation.
    double bestFitness = 0.0;
    int bestGeneration = -1;
    Genome lastGenerationBestGenome;
    double lastGenerationBestFitness = 0.0;
    int generationsCompleted = 0;
    bool completed = false; // False when stopped before maxGenerations.
    uint32_t seed = 0;
    std::vector<GenerationStats> history;
    double durationSec = 0.0;
};

void to_json(nlohmann::json& j, const GenerationStats& stats);
void to_json(nlohmann::json& j, const TrainingResult& result);

/**
 * Generational elitism + mutation optimizer over linear jump policies.
 *
 * Drives Idle -> Running -> (Paused <-> Running) -> Completed, or Stopped when cancelled.
 * Pause and stop are observed between generations only; the population is always swapped in
 * whole. Two RNG streams derive from one seed: one for breeding, one for per-episode spawn
 * seeds. Every episode gets its own seed up front, so results do not depend on the number of
 * evaluation threads.
 */
class Trainer {
public:
    enum class State : uint8_t {
        Idle,
        Running,
        Paused,
        Completed,
        Stopped,
    };

    struct Status {
        State state = State::Idle;
        int generation = 0; // Generations completed so far.
        int maxGenerations = 0;
        double bestFitnessThisGen = 0.0;
        double averageFitnessThisGen = 0.0;
        double bestFitnessAllTime = 0.0;
        int completedEvaluations = 0;
    };

    using ProgressCallback = std::function<void(const Status&)>;

    explicit Trainer(TrainingConfig config);
    ~Trainer();

    Trainer(const Trainer&) = delete;
    Trainer& operator=(const Trainer&) = delete;

    // Validates the config, seeds the RNG streams and builds generation 0.
    Result<std::monostate, std::string> start();

    // Evaluates and breeds one generation. Requires start().
    Status step();

    // Runs until maxGenerations or a stop request. Calls start() first when still Idle.
    Result<TrainingResult, std::string> run(const ProgressCallback& onProgress = {});

    // Safe to call from any thread. requestStop() is also safe from a signal handler.
    void pause();
    void resume();
    void requestStop();

    bool isTraining() const;
    State getState() const { return state_.load(); }
    Status getStatus() const;
    Genome getBestGenome() const;
    double getBestFitness() const;
    int getGeneration() const;
    std::vector<Genome> getPopulation() const;
    const TrainingConfig& getConfig() const { return config_; }
    uint32_t getSeed() const { return seed_; }

    TrainingResult getResult() const;

private:
    void initializePopulation();
    void setState(State next);
    bool waitWhilePaused();

    TrainingConfig config_;
    uint32_t seed_ = 0;
    std::mt19937 breedRng_;
    std::mt19937 seedRng_;
    std::unique_ptr<EvaluationPool> pool_;

    std::atomic<State> state_{ State::Idle };
    std::atomic<bool> pauseRequested_{ false };
    std::atomic<bool> stopRequested_{ false };

    mutable std::mutex mutex_; // Guards everything below.
    std::vector<Genome> population_;
    int generation_ = 0;
    int completedEvaluations_ = 0;
    Genome bestGenome_;
    double bestFitness_ = 0.0;
    int bestGeneration_ = -1;
    Genome lastGenerationBest_;
    double lastGenerationBestFitness_ = 0.0;
    std::vector<GenerationStats> history_;
    std::chrono::steady_clock::time_point startTime_;
    double durationSec_ = 0.0;
};

const char* toString(Trainer::State state);

} // namespace DashSim
