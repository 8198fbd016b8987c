#pragma once

#include "common/Completion.h"
#include "model/Session.h"

namespace SFR {

/**
 * @brief Persistence and mutual exclusion for sessions
 *
 * All operations are asynchronous: the completion is invoked exactly once,
 * possibly before the call returns. Errors are reported through the
 * completion; an implementation may also throw synchronously, which the
 * pipeline treats the same way.
 *
 * acquireLock() completes only once the caller holds the session lock. The
 * pipeline calls releaseLock() at most once per successful acquire.
 */
class ISessionStorage {
public:
    virtual ~ISessionStorage() = default;

    virtual void acquireLock(const SessionId &sessionId, Completion done) = 0;

    virtual void releaseLock(const SessionId &sessionId, Completion done) = 0;

    /**
     * @brief Read the persisted state and vars; state is null for a new session
     */
    virtual void loadStateAndVars(const SessionId &sessionId, ResultCallback<StateAndVars> done) = 0;

    /**
     * @brief Persist the session's state and vars under its id
     */
    virtual void store(const Session &session, Completion done) = 0;
};

}  // namespace SFR
