#pragma once

#include "common/FlowErrors.h"
#include "runtime/IFlowObserver.h"
#include "common/TestUtils.h"
#include <condition_variable>
#include <mutex>
#include <vector>

namespace SFR {
namespace Test {

/**
 * @brief IFlowObserver that lets tests block until events finish
 */
class CompletionRecorder : public IFlowObserver {
public:
    struct Completed {
        EventPtr event;
        FlowStage lastStage;
        std::exception_ptr error;
    };

    void onEventCompleted(const EventPtr &event, FlowStage lastStage, std::exception_ptr error) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            completed_.push_back({event, lastStage, error});
        }
        condition_.notify_all();
    }

    /**
     * @return true if at least count events completed before the timeout
     */
    bool waitFor(size_t count, std::chrono::milliseconds timeout = Utils::STANDARD_WAIT_MS) {
        std::unique_lock<std::mutex> lock(mutex_);
        return condition_.wait_for(lock, Utils::scaled(timeout), [&] { return completed_.size() >= count; });
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_.size();
    }

    std::vector<Completed> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_;
    }

    Completed last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_.back();
    }

    /**
     * @brief Kind of the last completion's error; fallback if it succeeded
     */
    ErrorKind lastErrorKind(ErrorKind fallback = ErrorKind::Submission) const {
        return FlowException::kindOf(last().error, fallback);
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::vector<Completed> completed_;
};

}  // namespace Test
}  // namespace SFR
