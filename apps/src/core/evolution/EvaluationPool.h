#pragma once

#include "core/brains/Genome.h"
#include "core/sim/Episode.h"
#include "core/sim/EpisodeConfig.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace DashSim {

struct EvaluationTask {
    int index = -1;
    Genome genome;
    uint32_t spawnSeed = 0;
};

/**
 * Runs independent episodes across a fixed set of threads.
 *
 * The calling thread takes part in every evaluate() call, so a pool of N workers starts
 * N - 1 background threads and a pool of one runs everything inline. Results are placed by
 * task index, so the output does not depend on which thread ran which episode.
 */
class EvaluationPool {
public:
    explicit EvaluationPool(int workerCount);
    ~EvaluationPool();

    EvaluationPool(const EvaluationPool&) = delete;
    EvaluationPool& operator=(const EvaluationPool&) = delete;

    // Blocks until every task has finished. Task indices must cover [0, tasks.size()).
    std::vector<EpisodeResult> evaluate(
        const std::vector<EvaluationTask>& tasks, const EpisodeConfig& config);

    int getWorkerCount() const { return workerCount_; }

    // 0 means one worker per hardware thread. Always at least 1.
    static int resolveWorkerCount(int requested);

private:
    struct WorkerTask {
        EvaluationTask task;
        EpisodeConfig config;
    };

    struct WorkerResult {
        int index = -1;
        EpisodeResult result;
    };

    struct WorkerState {
        std::vector<std::thread> workers;
        std::deque<WorkerTask> taskQueue;
        std::mutex taskMutex;
        std::condition_variable taskCv;
        std::deque<WorkerResult> resultQueue;
        std::mutex resultMutex;
        std::condition_variable resultCv;
        std::atomic<bool> stopRequested{ false };
    };

    void startWorkers();
    void stopWorkers();

    static WorkerResult runEvaluationTask(const WorkerTask& task);
    static void pushResult(WorkerState& state, WorkerResult result);

    int workerCount_ = 1;
    std::unique_ptr<WorkerState> workerState_;
};

} // namespace DashSim
