#pragma once

#include "core/Result.h"
#include "core/evolution/Trainer.h"
#include "core/evolution/TrainingConfig.h"

#include <atomic>
#include <string>

namespace DashSim {
namespace Client {

/**
 * Runs a headless training session in-process and reports progress on stderr.
 *
 * stdout is left untouched so the caller can print the result as JSON.
 */
class TrainRunner {
public:
    TrainRunner() = default;

    Result<TrainingResult, std::string> run(const TrainingConfig& config);

    /**
     * Request stop of current training (from signal handler).
     */
    void requestStop();

private:
    std::atomic<Trainer*> trainer_{ nullptr };
    std::atomic<bool> stopRequested_{ false };

    int lastGeneration_ = -1;

    void displayProgress(const Trainer::Status& status);
};

} // namespace Client
} // namespace DashSim
