#include "runtime/ThreadPoolExecutor.h"
#include "common/Logger.h"
#include <stdexcept>

namespace SFR {

thread_local const ThreadPoolExecutor *ThreadPoolExecutor::currentPool_ = nullptr;
thread_local bool ThreadPoolExecutor::exitAfterTask_ = false;

ThreadPoolExecutor::ThreadPoolExecutor(size_t threadCount) : threadCount_(threadCount) {
    if (threadCount_ == 0) {
        throw std::invalid_argument("ThreadPoolExecutor requires at least one worker thread");
    }

    workers_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        workers_.emplace_back(&ThreadPoolExecutor::workerMain, this);
    }

    LOG_DEBUG("ThreadPoolExecutor: Started {} worker threads", threadCount_);
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    shutdown(true);
}

void ThreadPoolExecutor::execute(std::function<void()> task) {
    enqueue(std::move(task), false);
}

void ThreadPoolExecutor::executeContinuation(std::function<void()> task) {
    enqueue(std::move(task), true);
}

void ThreadPoolExecutor::enqueue(std::function<void()> task, bool continuation) {
    if (!task) {
        throw std::invalid_argument("ThreadPoolExecutor cannot execute an empty task");
    }

    {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        if (!running_.load()) {
            throw std::runtime_error("ThreadPoolExecutor is shut down");
        }
        tasks_.push(QueuedTask{std::move(task), continuation});
    }
    tasksCondition_.notify_one();
}

void ThreadPoolExecutor::shutdown(bool waitForCompletion) {
    std::queue<QueuedTask> leftover;
    {
        std::lock_guard<std::mutex> shutdownLock(shutdownMutex_);
        stopWorkers(waitForCompletion);

        // Only left when the last worker detached itself; it does not come back for the queue
        std::lock_guard<std::mutex> lock(tasksMutex_);
        leftover.swap(tasks_);
    }

    if (!leftover.empty()) {
        LOG_DEBUG("ThreadPoolExecutor: Running {} remaining tasks on the shutting down thread", leftover.size());
    }
    while (!leftover.empty()) {
        runTask(leftover.front().run);
        leftover.pop();
    }
}

void ThreadPoolExecutor::stopWorkers(bool waitForCompletion) {
    // Destroyed after tasksMutex_ is released
    std::vector<QueuedTask> discarded;
    {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        if (!running_.exchange(false) && workers_.empty()) {
            return;
        }
        if (!workers_.empty()) {
            LOG_DEBUG("ThreadPoolExecutor: Shutting down (waitForCompletion={}, pending={})", waitForCompletion,
                      tasks_.size());
        }
        if (!waitForCompletion) {
            std::queue<QueuedTask> kept;
            while (!tasks_.empty()) {
                if (tasks_.front().continuation) {
                    kept.push(std::move(tasks_.front()));
                } else {
                    discarded.push_back(std::move(tasks_.front()));
                }
                tasks_.pop();
            }
            tasks_.swap(kept);
            if (!discarded.empty()) {
                LOG_DEBUG("ThreadPoolExecutor: Discarded {} queued tasks, {} continuations still run",
                          discarded.size(), tasks_.size());
            }
        }
    }
    tasksCondition_.notify_all();

    for (auto &worker : workers_) {
        if (!worker.joinable()) {
            continue;
        }
        if (currentPool_ == this && worker.get_id() == std::this_thread::get_id()) {
            // Called from one of our own tasks: this worker exits once the task returns
            LOG_WARN("ThreadPoolExecutor: shutdown() called from a worker thread, detaching it");
            worker.detach();
            exitAfterTask_ = true;
        } else {
            worker.join();
        }
    }
    workers_.clear();
}

size_t ThreadPoolExecutor::getPendingTaskCount() const {
    std::lock_guard<std::mutex> lock(tasksMutex_);
    return tasks_.size();
}

void ThreadPoolExecutor::workerMain() {
    currentPool_ = this;

    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(tasksMutex_);
            tasksCondition_.wait(lock, [this] { return !running_.load() || !tasks_.empty(); });

            // Anything still queued after shutdown() is meant to run
            if (tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front().run);
            tasks_.pop();
        }

        runTask(task);

        // Dropping the task may release the last reference to this pool
        task = nullptr;
        if (exitAfterTask_) {
            exitAfterTask_ = false;
            currentPool_ = nullptr;
            return;
        }
    }
}

void ThreadPoolExecutor::runTask(const std::function<void()> &task) {
    try {
        task();
    } catch (const std::exception &e) {
        LOG_ERROR("ThreadPoolExecutor: Task threw an exception: {}", e.what());
    } catch (...) {
        LOG_ERROR("ThreadPoolExecutor: Task threw an unknown exception");
    }
}

}  // namespace SFR
