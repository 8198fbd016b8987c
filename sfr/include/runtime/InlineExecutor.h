#pragma once

#include "runtime/IExecutor.h"

namespace SFR {

/**
 * @brief Runs each task immediately on the calling thread
 *
 * Single-threaded cooperative mode: a pipeline runs until its first
 * asynchronous suspension before execute() returns.
 */
class InlineExecutor : public IExecutor {
public:
    void execute(std::function<void()> task) override;
};

}  // namespace SFR
