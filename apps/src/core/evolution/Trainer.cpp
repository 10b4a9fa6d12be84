#include "Trainer.h"
#include "Selection.h"

#include "core/Assert.h"
#include "core/LoggingChannels.h"
#include "core/ReflectSerializer.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <thread>

namespace DashSim {

namespace {
constexpr auto kPausePollInterval = std::chrono::milliseconds(100);
} // namespace

const char* toString(Trainer::State state)
{
    switch (state) {
        case Trainer::State::Idle:
            return "Idle";
        case Trainer::State::Running:
            return "Running";
        case Trainer::State::Paused:
            return "Paused";
        case Trainer::State::Completed:
            return "Completed";
        case Trainer::State::Stopped:
            return "Stopped";
    }
    return "Unknown";
}

void to_json(nlohmann::json& j, const GenerationStats& stats)
{
    j = ReflectSerializer::to_json(stats);
}

void to_json(nlohmann::json& j, const TrainingResult& result)
{
    j = ReflectSerializer::to_json(result);
}

Trainer::Trainer(TrainingConfig config) : config_(std::move(config))
{}

Trainer::~Trainer() = default;

Result<std::monostate, std::string> Trainer::start()
{
    if (state_.load() != State::Idle) {
        return Result<std::monostate, std::string>::error(
            std::string("Trainer already started (state ") + toString(state_.load()) + ")");
    }

    auto validation = validate(config_);
    if (validation.isError()) {
        LOG_ERROR(Evolution, "Trainer: Invalid training config: {}", validation.errorValue());
        return validation;
    }

    if (config_.seed.has_value()) {
        seed_ = config_.seed.value();
    }
    else {
        std::random_device device;
        seed_ = device();
    }
    std::seed_seq breedSeq{ seed_, 1u };
    std::seed_seq spawnSeq{ seed_, 2u };
    breedRng_.seed(breedSeq);
    seedRng_.seed(spawnSeq);

    pool_ = std::make_unique<EvaluationPool>(config_.evolution.maxParallelEvaluations);

    initializePopulation();
    startTime_ = std::chrono::steady_clock::now();

    LOG_INFO(
        Evolution,
        "Trainer: Starting (population {}, generations {}, mutation rate {}, scale {}, seed {}, "
        "{} workers)",
        config_.evolution.populationSize,
        config_.evolution.maxGenerations,
        config_.mutation.rate,
        toString(config_.mutation.scale),
        seed_,
        pool_->getWorkerCount());
    if (config_.presentation.ghostBlend) {
        LOG_DEBUG(Evolution, "Trainer: ghostBlend set (display only)");
    }

    setState(State::Running);
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

void Trainer::initializePopulation()
{
    std::lock_guard<std::mutex> lock(mutex_);

    population_.clear();
    population_.reserve(config_.evolution.populationSize);
    population_.insert(
        population_.end(), config_.seedGenomes.begin(), config_.seedGenomes.end());
    while (static_cast<int>(population_.size()) < config_.evolution.populationSize) {
        population_.push_back(Genome::random(breedRng_));
    }

    generation_ = 0;
    completedEvaluations_ = 0;
    bestGenome_ = population_.front();
    bestFitness_ = -std::numeric_limits<double>::infinity();
    bestGeneration_ = -1;
    lastGenerationBest_ = population_.front();
    lastGenerationBestFitness_ = -std::numeric_limits<double>::infinity();
    history_.clear();

    LOG_DEBUG(
        Evolution,
        "Trainer: Initial population of {} ({} seeded)",
        population_.size(),
        config_.seedGenomes.size());
}

Trainer::Status Trainer::step()
{
    const State current = state_.load();
    DASHSIM_ASSERT(
        current == State::Running || current == State::Paused, "Trainer::step() before start()");

    std::vector<Genome> population;
    int generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        population = population_;
        generation = generation_;
    }

    std::vector<EvaluationTask> tasks;
    tasks.reserve(population.size());
    for (size_t i = 0; i < population.size(); ++i) {
        tasks.push_back(
            EvaluationTask{
                .index = static_cast<int>(i),
                .genome = population[i],
                .spawnSeed = static_cast<uint32_t>(seedRng_()),
            });
    }

    const std::vector<EpisodeResult> results = pool_->evaluate(tasks, config_.episode);

    std::vector<double> fitness;
    fitness.reserve(results.size());
    for (const auto& result : results) {
        fitness.push_back(result.survivalTime);
    }

    std::vector<FitnessRecord> records = makeRecords(population, fitness);

    double sum = 0.0;
    int finiteCount = 0;
    double worst = std::numeric_limits<double>::infinity();
    for (const auto& record : records) {
        worst = std::min(worst, record.fitness);
        if (std::isfinite(record.fitness)) {
            sum += record.fitness;
            finiteCount++;
        }
    }
    const double average = finiteCount > 0 ? sum / finiteCount : 0.0;

    rankRecords(records);
    const FitnessRecord& genBest = records.front();

    BreedingStats breedingStats;
    std::vector<Genome> next = breedNextGeneration(
        records,
        config_.evolution.populationSize,
        config_.evolution.eliteFraction,
        config_.mutation,
        breedRng_,
        &breedingStats);

    const int completedGeneration = generation + 1;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        population_ = std::move(next);
        generation_ = completedGeneration;
        completedEvaluations_ += static_cast<int>(results.size());

        lastGenerationBest_ = genBest.genome;
        lastGenerationBestFitness_ = genBest.fitness;
        if (bestGeneration_ < 0 || genBest.fitness > bestFitness_) {
            bestGenome_ = genBest.genome;
            bestFitness_ = genBest.fitness;
            bestGeneration_ = generation;
        }

        history_.push_back(
            GenerationStats{
                .generation = generation,
                .bestFitness = genBest.fitness,
                .averageFitness = average,
                .worstFitness = worst,
            });
    }

    LOG_INFO(
        Evolution,
        "Generation {}/{} - best {:.2f}s - avg {:.2f}s",
        completedGeneration,
        config_.evolution.maxGenerations,
        genBest.fitness,
        average);
    LOG_DEBUG(
        Evolution,
        "Trainer: Best {} | elites {} | offspring mutated {}/{} | clamped {} | sigma [{:.3f}, "
        "{:.3f}, {:.3f}]",
        genBest.genome.toString(),
        breedingStats.eliteCount,
        breedingStats.offspringMutated,
        breedingStats.offspringCount,
        breedingStats.clamped,
        breedingStats.sigmas[Genome::DistanceWeight],
        breedingStats.sigmas[Genome::HeightWeight],
        breedingStats.sigmas[Genome::Bias]);

    if (completedGeneration >= config_.evolution.maxGenerations) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            durationSec_ =
                std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime_)
                    .count();
        }
        setState(State::Completed);
    }

    return getStatus();
}

Result<TrainingResult, std::string> Trainer::run(const ProgressCallback& onProgress)
{
    if (state_.load() == State::Idle) {
        auto started = start();
        if (started.isError()) {
            return Result<TrainingResult, std::string>::error(started.errorValue());
        }
    }

    while (state_.load() == State::Running || state_.load() == State::Paused) {
        if (!waitWhilePaused()) {
            break;
        }
        if (stopRequested_.load()) {
            break;
        }

        const Status status = step();
        if (onProgress) {
            onProgress(status);
        }
    }

    if (state_.load() != State::Completed) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            durationSec_ =
                std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime_)
                    .count();
        }
        setState(State::Stopped);
        LOG_INFO(Evolution, "Trainer: Stopped after {} generations", getGeneration());
    }

    return Result<TrainingResult, std::string>::okay(getResult());
}

bool Trainer::waitWhilePaused()
{
    if (!pauseRequested_.load()) {
        return true;
    }

    setState(State::Paused);
    while (pauseRequested_.load() && !stopRequested_.load()) {
        std::this_thread::sleep_for(kPausePollInterval);
    }
    if (stopRequested_.load()) {
        return false;
    }
    setState(State::Running);
    return true;
}

void Trainer::pause()
{
    pauseRequested_.store(true);
}

void Trainer::resume()
{
    pauseRequested_.store(false);
}

void Trainer::requestStop()
{
    stopRequested_.store(true);
}

void Trainer::setState(State next)
{
    const State previous = state_.exchange(next);
    if (previous != next) {
        LOG_INFO(State, "Trainer: {} -> {}", toString(previous), toString(next));
    }
}

bool Trainer::isTraining() const
{
    const State current = state_.load();
    return current == State::Running || current == State::Paused;
}

Trainer::Status Trainer::getStatus() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    Status status;
    status.state = state_.load();
    status.generation = generation_;
    status.maxGenerations = config_.evolution.maxGenerations;
    status.completedEvaluations = completedEvaluations_;
    status.bestFitnessAllTime = bestFitness_;
    if (!history_.empty()) {
        status.bestFitnessThisGen = history_.back().bestFitness;
        status.averageFitnessThisGen = history_.back().averageFitness;
    }
    return status;
}

Genome Trainer::getBestGenome() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return bestGenome_;
}

double Trainer::getBestFitness() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return bestFitness_;
}

int Trainer::getGeneration() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

std::vector<Genome> Trainer::getPopulation() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return population_;
}

TrainingResult Trainer::getResult() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    TrainingResult result;
    result.bestGenome = bestGenome_;
    result.bestFitness = bestFitness_;
    result.bestGeneration = bestGeneration_;
    result.lastGenerationBestGenome = lastGenerationBest_;
    result.lastGenerationBestFitness = lastGenerationBestFitness_;
    result.generationsCompleted = generation_;
    result.completed = state_.load() == State::Completed;
    result.seed = seed_;
    result.history = history_;
    result.durationSec = durationSec_;
    return result;
}

} // namespace DashSim
