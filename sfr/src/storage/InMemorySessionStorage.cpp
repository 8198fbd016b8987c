#include "storage/InMemorySessionStorage.h"
#include "common/Logger.h"
#include "runtime/InlineExecutor.h"
#include <stdexcept>

namespace SFR {

thread_local std::deque<Completion> *InMemorySessionStorage::pendingWakeups_ = nullptr;

InMemorySessionStorage::InMemorySessionStorage(std::shared_ptr<IExecutor> handoffExecutor)
    : handoffExecutor_(handoffExecutor ? std::move(handoffExecutor) : std::make_shared<InlineExecutor>()) {}

void InMemorySessionStorage::acquireLock(const SessionId &sessionId, Completion done) {
    if (!done) {
        throw std::invalid_argument("acquireLock requires a completion");
    }

    {
        std::lock_guard<std::mutex> lock(locksMutex_);
        auto &entry = locks_[sessionId];
        if (entry.held) {
            entry.waiters.push_back(std::move(done));
            LOG_TRACE("InMemorySessionStorage: Session '{}' locked, {} waiting", sessionId, entry.waiters.size());
            return;
        }
        entry.held = true;
    }

    done(nullptr);
}

void InMemorySessionStorage::releaseLock(const SessionId &sessionId, Completion done) {
    Completion next;
    std::exception_ptr error;

    {
        std::lock_guard<std::mutex> lock(locksMutex_);
        auto it = locks_.find(sessionId);
        if (it == locks_.end() || !it->second.held) {
            error = std::make_exception_ptr(std::logic_error("Session lock is not held: " + sessionId));
        } else if (it->second.waiters.empty()) {
            locks_.erase(it);
        } else {
            // Ownership passes straight to the next waiter; the lock never becomes free in between
            next = std::move(it->second.waiters.front());
            it->second.waiters.pop_front();
        }
    }

    if (next) {
        handOff(std::move(next));
    }

    if (done) {
        done(error);
    }
}

void InMemorySessionStorage::loadStateAndVars(const SessionId &sessionId, ResultCallback<StateAndVars> done) {
    if (!done) {
        throw std::invalid_argument("loadStateAndVars requires a completion");
    }

    StateAndVars result;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        auto it = sessions_.find(sessionId);
        if (it != sessions_.end()) {
            result = it->second;
        }
    }

    done(StageResult<StateAndVars>::createSuccess(std::move(result)));
}

void InMemorySessionStorage::store(const Session &session, Completion done) {
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        sessions_.insert_or_assign(session.getId(), StateAndVars{session.getState(), session.getVars()});
    }

    if (done) {
        done(nullptr);
    }
}

bool InMemorySessionStorage::isLocked(const SessionId &sessionId) const {
    std::lock_guard<std::mutex> lock(locksMutex_);
    auto it = locks_.find(sessionId);
    return it != locks_.end() && it->second.held;
}

size_t InMemorySessionStorage::getWaiterCount(const SessionId &sessionId) const {
    std::lock_guard<std::mutex> lock(locksMutex_);
    auto it = locks_.find(sessionId);
    return it != locks_.end() ? it->second.waiters.size() : 0;
}

std::optional<StateAndVars> InMemorySessionStorage::getStateAndVars(const SessionId &sessionId) const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t InMemorySessionStorage::getSessionCount() const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    return sessions_.size();
}

void InMemorySessionStorage::put(const SessionId &sessionId, StateAndVars stateAndVars) {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    sessions_.insert_or_assign(sessionId, std::move(stateAndVars));
}

bool InMemorySessionStorage::erase(const SessionId &sessionId) {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    return sessions_.erase(sessionId) > 0;
}

void InMemorySessionStorage::handOff(Completion waiter) {
    auto shared = std::make_shared<Completion>(std::move(waiter));
    try {
        handoffExecutor_->executeContinuation([shared] { wake(std::move(*shared)); });
    } catch (const std::exception &e) {
        // Executor gone: wake the waiter here rather than leave the lock owned by nobody
        LOG_WARN("InMemorySessionStorage: Handoff executor rejected waiter ({}), waking inline", e.what());
        wake(std::move(*shared));
    }
}

void InMemorySessionStorage::wake(Completion waiter) {
    if (pendingWakeups_) {
        // Already waking a waiter further up this stack; it runs once that one returns
        pendingWakeups_->push_back(std::move(waiter));
        return;
    }

    std::deque<Completion> queue;
    queue.push_back(std::move(waiter));
    pendingWakeups_ = &queue;
    while (!queue.empty()) {
        Completion next = std::move(queue.front());
        queue.pop_front();
        try {
            next(nullptr);
        } catch (const std::exception &e) {
            LOG_ERROR("InMemorySessionStorage: Lock waiter threw: {}", e.what());
        } catch (...) {
            LOG_ERROR("InMemorySessionStorage: Lock waiter threw an unknown exception");
        }
    }
    pendingWakeups_ = nullptr;
}

}  // namespace SFR
