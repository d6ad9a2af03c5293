#include "JobWorkerPool.h"
#include <SDL3/SDL_log.h>
#include <exception>

namespace LabPBR {

std::unique_ptr<JobWorkerPool> JobWorkerPool::create(uint32_t workerCount) {
    if (workerCount == 0) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "JobWorkerPool: worker count must be at least 1");
        return nullptr;
    }

    std::unique_ptr<JobWorkerPool> pool(new JobWorkerPool());
    if (!pool->init(workerCount)) {
        return nullptr;
    }
    return pool;
}

JobWorkerPool::~JobWorkerPool() {
    shutdown();
}

bool JobWorkerPool::init(uint32_t workerCount) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        running_ = true;
    }

    workers_.reserve(workerCount);
    for (uint32_t i = 0; i < workerCount; ++i) {
        workers_.emplace_back(&JobWorkerPool::workerLoop, this);
    }

    SDL_Log("JobWorkerPool initialized with %u workers", workerCount);
    return true;
}

bool JobWorkerPool::submit(std::string id, std::function<void()> execute, int priority,
                           std::function<void()> onDropped) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "JobWorkerPool: rejected task '%s' after shutdown", id.c_str());
            return false;
        }
        taskQueue_.push(PoolTask{std::move(id), priority, nextSequence_++, std::move(execute), std::move(onDropped)});
    }
    queueCondition_.notify_one();
    return true;
}

void JobWorkerPool::waitForIdle() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idleCondition_.wait(lock, [this] {
        return taskQueue_.empty() && activeTasks_ == 0;
    });
}

PoolStats JobWorkerPool::getStats() const {
    PoolStats stats;
    stats.workerCount = getWorkerCount();
    stats.completedTasks = completedTasks_.load();
    stats.failedTasks = failedTasks_.load();

    std::lock_guard<std::mutex> lock(queueMutex_);
    stats.queuedTasks = static_cast<uint32_t>(taskQueue_.size());
    stats.activeTasks = activeTasks_;
    return stats;
}

void JobWorkerPool::shutdown() {
    std::vector<PoolTask> dropped;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_ && workers_.empty()) {
            return;
        }
        running_ = false;

        while (!taskQueue_.empty()) {
            dropped.push_back(std::move(const_cast<PoolTask&>(taskQueue_.top())));
            taskQueue_.pop();
        }
    }
    queueCondition_.notify_all();
    idleCondition_.notify_all();

    if (!dropped.empty()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "JobWorkerPool: dropped %zu queued tasks on shutdown", dropped.size());
    }
    for (auto& task : dropped) {
        if (!task.onDropped) continue;
        try {
            task.onDropped();
        } catch (const std::exception& e) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                         "JobWorkerPool: drop handler for '%s' failed: %s", task.id.c_str(), e.what());
        }
    }

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    SDL_Log("JobWorkerPool shutdown complete");
}

void JobWorkerPool::workerLoop() {
    while (true) {
        PoolTask task;

        {
            std::unique_lock<std::mutex> lock(queueMutex_);

            queueCondition_.wait(lock, [this] {
                return !running_ || !taskQueue_.empty();
            });

            if (!running_ && taskQueue_.empty()) {
                return;
            }

            task = std::move(const_cast<PoolTask&>(taskQueue_.top()));
            taskQueue_.pop();
            ++activeTasks_;
        }

        // Execute outside of lock
        bool failed = false;
        try {
            if (task.execute) {
                task.execute();
            }
        } catch (const std::exception& e) {
            failed = true;
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                         "JobWorkerPool: task '%s' failed: %s", task.id.c_str(), e.what());
        }

        if (failed) {
            ++failedTasks_;
        } else {
            ++completedTasks_;
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            --activeTasks_;
            if (taskQueue_.empty() && activeTasks_ == 0) {
                idleCondition_.notify_all();
            }
        }
    }
}

} // namespace LabPBR
