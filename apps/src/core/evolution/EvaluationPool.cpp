#include "EvaluationPool.h"

#include "core/Assert.h"
#include "core/LoggingChannels.h"

#include <algorithm>

namespace DashSim {

EvaluationPool::EvaluationPool(int workerCount)
    : workerCount_(resolveWorkerCount(workerCount)),
      workerState_(std::make_unique<WorkerState>())
{
    startWorkers();
}

EvaluationPool::~EvaluationPool()
{
    stopWorkers();
}

int EvaluationPool::resolveWorkerCount(int requested)
{
    if (requested > 0) {
        return requested;
    }
    const unsigned int detected = std::thread::hardware_concurrency();
    return detected > 0 ? static_cast<int>(detected) : 1;
}

void EvaluationPool::startWorkers()
{
    const int backgroundWorkerCount = std::max(0, workerCount_ - 1);
    if (backgroundWorkerCount <= 0) {
        LOG_DEBUG(Evolution, "EvaluationPool: Running evaluations inline");
        return;
    }

    workerState_->workers.reserve(backgroundWorkerCount);
    WorkerState* state = workerState_.get();
    for (int i = 0; i < backgroundWorkerCount; ++i) {
        workerState_->workers.emplace_back([state]() {
            while (true) {
                WorkerTask task;
                {
                    std::unique_lock<std::mutex> lock(state->taskMutex);
                    state->taskCv.wait(lock, [state]() {
                        return state->stopRequested || !state->taskQueue.empty();
                    });
                    if (state->stopRequested) {
                        return;
                    }
                    task = std::move(state->taskQueue.front());
                    state->taskQueue.pop_front();
                }

                pushResult(*state, runEvaluationTask(task));
            }
        });
    }

    LOG_DEBUG(
        Evolution,
        "EvaluationPool: Started {} background workers ({} total)",
        backgroundWorkerCount,
        workerCount_);
}

void EvaluationPool::stopWorkers()
{
    if (!workerState_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(workerState_->taskMutex);
        workerState_->stopRequested = true;
    }
    workerState_->taskCv.notify_all();

    for (auto& worker : workerState_->workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workerState_->workers.clear();

    {
        std::lock_guard<std::mutex> lock(workerState_->taskMutex);
        workerState_->taskQueue.clear();
    }
    {
        std::lock_guard<std::mutex> lock(workerState_->resultMutex);
        workerState_->resultQueue.clear();
    }
}

EvaluationPool::WorkerResult EvaluationPool::runEvaluationTask(const WorkerTask& task)
{
    return WorkerResult{
        .index = task.task.index,
        .result = runEpisode(task.task.genome, task.config, task.task.spawnSeed),
    };
}

void EvaluationPool::pushResult(WorkerState& state, WorkerResult result)
{
    {
        std::lock_guard<std::mutex> lock(state.resultMutex);
        state.resultQueue.push_back(std::move(result));
    }
    state.resultCv.notify_one();
}

std::vector<EpisodeResult> EvaluationPool::evaluate(
    const std::vector<EvaluationTask>& tasks, const EpisodeConfig& config)
{
    std::vector<EpisodeResult> results(tasks.size());
    if (tasks.empty()) {
        return results;
    }

    {
        std::lock_guard<std::mutex> lock(workerState_->taskMutex);
        for (const auto& task : tasks) {
            DASHSIM_ASSERT(
                task.index >= 0 && task.index < static_cast<int>(tasks.size()),
                "Evaluation task index out of range");
            workerState_->taskQueue.push_back(WorkerTask{ .task = task, .config = config });
        }
    }
    workerState_->taskCv.notify_all();

    // The calling thread works the same queue until it is empty.
    while (true) {
        WorkerTask task;
        {
            std::lock_guard<std::mutex> lock(workerState_->taskMutex);
            if (workerState_->taskQueue.empty()) {
                break;
            }
            task = std::move(workerState_->taskQueue.front());
            workerState_->taskQueue.pop_front();
        }
        pushResult(*workerState_, runEvaluationTask(task));
    }

    size_t received = 0;
    std::vector<bool> seen(tasks.size(), false);
    while (received < tasks.size()) {
        std::deque<WorkerResult> drained;
        {
            std::unique_lock<std::mutex> lock(workerState_->resultMutex);
            workerState_->resultCv.wait(
                lock, [this]() { return !workerState_->resultQueue.empty(); });
            drained.swap(workerState_->resultQueue);
        }

        for (auto& result : drained) {
            const auto slot = static_cast<size_t>(result.index);
            DASHSIM_ASSERT(!seen[slot], "Evaluation task index reported twice");
            seen[slot] = true;
            results[slot] = std::move(result.result);
            received++;
        }
    }

    return results;
}

} // namespace DashSim
