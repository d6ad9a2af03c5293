#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

/**
 * JobWorkerPool - fixed-size worker pool for conversion and validation work
 *
 * Design:
 * - A fixed number of worker threads bounds how many jobs run at once;
 *   further submissions wait in the queue
 * - Tasks are prioritized (lower value = higher priority), FIFO within a priority
 * - Pixel-heavy work (synthesis, validation, analysis) runs here, never on
 *   the thread that submitted it
 */

namespace LabPBR {

struct PoolTask {
    std::string id;
    int priority = 0;  // Lower = higher priority
    uint64_t sequence = 0;
    std::function<void()> execute;
    std::function<void()> onDropped;  // Called instead of execute if shutdown discards the task

    bool operator<(const PoolTask& other) const {
        if (priority != other.priority) {
            return priority > other.priority;  // Min-heap on priority
        }
        return sequence > other.sequence;
    }
};

struct PoolStats {
    uint32_t workerCount = 0;
    uint32_t queuedTasks = 0;
    uint32_t activeTasks = 0;
    uint64_t completedTasks = 0;
    uint64_t failedTasks = 0;
};

class JobWorkerPool {
public:
    /**
     * Factory: Create and start the pool with worker threads
     * Returns nullptr if workerCount is zero
     */
    static std::unique_ptr<JobWorkerPool> create(uint32_t workerCount = 2);

    ~JobWorkerPool();

    // Non-copyable, non-movable
    JobWorkerPool(const JobWorkerPool&) = delete;
    JobWorkerPool& operator=(const JobWorkerPool&) = delete;
    JobWorkerPool(JobWorkerPool&&) = delete;
    JobWorkerPool& operator=(JobWorkerPool&&) = delete;

    /**
     * Queue a task. Returns false once the pool is shutting down.
     * onDropped runs on the shutting-down thread for tasks that never started.
     */
    bool submit(std::string id, std::function<void()> execute, int priority = 0,
                std::function<void()> onDropped = {});

    /**
     * Block until the queue is empty and no task is running
     */
    void waitForIdle();

    PoolStats getStats() const;

    uint32_t getWorkerCount() const { return static_cast<uint32_t>(workers_.size()); }

    /**
     * Finish running tasks, drop queued ones (running their onDropped) and join the workers
     */
    void shutdown();

private:
    JobWorkerPool() = default;
    bool init(uint32_t workerCount);
    void workerLoop();

    std::vector<std::thread> workers_;
    bool running_ = false;  // Guarded by queueMutex_

    mutable std::mutex queueMutex_;
    std::priority_queue<PoolTask> taskQueue_;
    std::condition_variable queueCondition_;
    std::condition_variable idleCondition_;
    uint32_t activeTasks_ = 0;  // Guarded by queueMutex_
    uint64_t nextSequence_ = 0;

    std::atomic<uint64_t> completedTasks_{0};
    std::atomic<uint64_t> failedTasks_{0};
};

} // namespace LabPBR
