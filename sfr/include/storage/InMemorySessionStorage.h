#pragma once

#include "runtime/IExecutor.h"
#include "storage/ISessionStorage.h"
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace SFR {

/**
 * @brief Process-local session storage with asynchronous per-session locks
 *
 * Lock waiters do not occupy a thread: a contended acquireLock() parks its
 * completion, and releaseLock() hands the lock directly to the oldest
 * waiter (FIFO). The hand-over completion is run through the handoff
 * executor, so with a worker pool the next event continues on a fresh task
 * instead of on the releasing event's stack. Hand-offs are submitted as
 * continuations and still run if the pool is shut down without draining.
 *
 * With an inline handoff executor, a waiter woken while another waiter's
 * completion is running on the same thread is queued and woken after it
 * returns, so a long line of waiters does not grow the stack.
 */
class InMemorySessionStorage : public ISessionStorage {
public:
    /**
     * @param handoffExecutor Executor for waking lock waiters (inline if null)
     */
    explicit InMemorySessionStorage(std::shared_ptr<IExecutor> handoffExecutor = nullptr);

    void acquireLock(const SessionId &sessionId, Completion done) override;
    void releaseLock(const SessionId &sessionId, Completion done) override;
    void loadStateAndVars(const SessionId &sessionId, ResultCallback<StateAndVars> done) override;
    void store(const Session &session, Completion done) override;

    // Inspection helpers (tests, admin tooling)

    bool isLocked(const SessionId &sessionId) const;
    size_t getWaiterCount(const SessionId &sessionId) const;
    std::optional<StateAndVars> getStateAndVars(const SessionId &sessionId) const;
    size_t getSessionCount() const;

    /**
     * @brief Seed a session, bypassing locks (tests, migrations)
     */
    void put(const SessionId &sessionId, StateAndVars stateAndVars);

    /**
     * @brief Remove a session's persisted state; a held lock is left untouched
     */
    bool erase(const SessionId &sessionId);

private:
    struct LockEntry {
        bool held = false;
        std::deque<Completion> waiters;
    };

    void handOff(Completion waiter);
    static void wake(Completion waiter);

    // Waiters queued by wake() calls nested inside a running wake() on this thread
    static thread_local std::deque<Completion> *pendingWakeups_;

    std::shared_ptr<IExecutor> handoffExecutor_;

    mutable std::mutex locksMutex_;
    std::unordered_map<SessionId, LockEntry> locks_;

    mutable std::mutex sessionsMutex_;
    std::unordered_map<SessionId, StateAndVars> sessions_;
};

}  // namespace SFR
