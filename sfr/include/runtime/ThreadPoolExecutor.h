#pragma once

#include "runtime/IExecutor.h"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace SFR {

/**
 * @brief Fixed-size worker pool
 *
 * Tasks are taken from a single FIFO queue. Different sessions' pipelines
 * run in parallel; same-session ordering is left to the session lock.
 */
class ThreadPoolExecutor : public IExecutor {
public:
    /**
     * @param threadCount Number of workers (at least one)
     * @throws std::invalid_argument if threadCount is zero
     */
    explicit ThreadPoolExecutor(size_t threadCount);

    /**
     * @brief Drains queued tasks and joins the workers
     */
    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor &) = delete;
    ThreadPoolExecutor &operator=(const ThreadPoolExecutor &) = delete;

    /**
     * @throws std::runtime_error after shutdown()
     */
    void execute(std::function<void()> task) override;

    /**
     * @brief Like execute(), but survives shutdown(false)
     * @throws std::runtime_error after shutdown()
     */
    void executeContinuation(std::function<void()> task) override;

    /**
     * @brief Stop accepting tasks and join workers
     *
     * @param waitForCompletion Run the tasks still queued before joining
     *        (otherwise they are discarded, except continuations)
     */
    void shutdown(bool waitForCompletion = true);

    bool isRunning() const {
        return running_.load();
    }

    size_t getThreadCount() const {
        return threadCount_;
    }

    size_t getPendingTaskCount() const;

private:
    struct QueuedTask {
        std::function<void()> run;
        bool continuation = false;
    };

    void enqueue(std::function<void()> task, bool continuation);
    void stopWorkers(bool waitForCompletion);
    void workerMain();
    static void runTask(const std::function<void()> &task);

    size_t threadCount_;
    std::vector<std::thread> workers_;
    std::queue<QueuedTask> tasks_;
    mutable std::mutex tasksMutex_;
    std::mutex shutdownMutex_;
    std::condition_variable tasksCondition_;
    std::atomic<bool> running_{true};

    // Set on worker threads so shutdown() from a task does not join itself
    static thread_local const ThreadPoolExecutor *currentPool_;
    // Set when a worker detached itself; it must not touch the pool after its task
    static thread_local bool exitAfterTask_;
};

}  // namespace SFR
