#pragma once

#include <functional>
#include <utility>

namespace SFR {

/**
 * @brief Execution context on which event pipelines are started
 *
 * Implementations may run the task inline or hand it to worker threads.
 * execute() throws if the task cannot be accepted (e.g. after shutdown).
 */
class IExecutor {
public:
    virtual ~IExecutor() = default;

    virtual void execute(std::function<void()> task) = 0;

    /**
     * @brief Run a task that resumes work already holding resources
     *
     * Used for lock hand-offs: the task owns a session lock, so an executor
     * that discards queued tasks on shutdown must still run this one.
     */
    virtual void executeContinuation(std::function<void()> task) {
        execute(std::move(task));
    }
};

}  // namespace SFR
