#include "TrainRunner.h"
#include "core/LoggingChannels.h"

#include <iomanip>
#include <iostream>

namespace DashSim {
namespace Client {

Result<TrainingResult, std::string> TrainRunner::run(const TrainingConfig& config)
{
    Trainer trainer(config);

    auto started = trainer.start();
    if (started.isError()) {
        return Result<TrainingResult, std::string>::error(started.errorValue());
    }

    SLOG_INFO(
        "Training {} policies for {} generations (seed {})",
        config.evolution.populationSize,
        config.evolution.maxGenerations,
        trainer.getSeed());

    trainer_.store(&trainer);
    if (stopRequested_.load()) {
        trainer.requestStop();
    }

    auto result = trainer.run([this](const Trainer::Status& status) { displayProgress(status); });

    trainer_.store(nullptr);

    if (result.isValue()) {
        const TrainingResult& summary = result.value();
        if (!summary.completed && lastGeneration_ >= 0) {
            std::cerr << std::endl;
        }
        SLOG_INFO(
            "Training {}: best {:.2f}s in generation {} {}",
            summary.completed ? "complete" : "stopped",
            summary.bestFitness,
            summary.bestGeneration,
            summary.bestGenome.toString());
    }
    return result;
}

void TrainRunner::requestStop()
{
    stopRequested_ = true;
    if (Trainer* trainer = trainer_.load()) {
        trainer->requestStop();
    }
}

void TrainRunner::displayProgress(const Trainer::Status& status)
{
    if (status.generation == lastGeneration_) {
        return;
    }
    lastGeneration_ = status.generation;

    // Progress bar for the whole run.
    const int barWidth = 30;
    const int progress = status.maxGenerations > 0
        ? (status.generation * barWidth) / status.maxGenerations
        : 0;

    std::cerr << "\r";
    std::cerr << "Gen " << std::setw(3) << status.generation << "/" << status.maxGenerations
              << " ";
    std::cerr << "[";
    for (int i = 0; i < barWidth; ++i) {
        std::cerr << (i < progress ? "=" : " ");
    }
    std::cerr << "] ";
    std::cerr << "gen=" << std::fixed << std::setprecision(2) << status.bestFitnessThisGen << " ";
    std::cerr << "best=" << std::setprecision(2) << status.bestFitnessAllTime << " ";
    std::cerr << "avg=" << std::setprecision(2) << status.averageFitnessThisGen;
    std::cerr << std::flush;

    if (status.generation >= status.maxGenerations) {
        std::cerr << std::endl;
    }
}

} // namespace Client
} // namespace DashSim
