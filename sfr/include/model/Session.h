#pragma once

#include "model/Event.h"
#include "model/State.h"
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace SFR {

/**
 * @brief Auxiliary per-session data not modelled as state transitions
 */
using Vars = std::map<std::string, nlohmann::json>;

/**
 * @brief Persisted part of a session as returned by storage
 */
struct StateAndVars {
    StatePtr state;
    Vars vars;
};

/**
 * @brief Immutable snapshot of a session for the duration of one event
 *
 * Rebuilt from storage after the lock is taken; a transition yields a new
 * Session through withState() instead of mutating this one.
 */
class Session {
public:
    Session(SessionId id, StatePtr state, Vars vars);

    static Session of(const SessionId &id, StateAndVars stateAndVars);

    const SessionId &getId() const {
        return id_;
    }

    const StatePtr &getState() const {
        return state_;
    }

    const Vars &getVars() const {
        return vars_;
    }

    bool hasState() const {
        return static_cast<bool>(state_);
    }

    /**
     * @brief State downcast to T, or nullptr if the state is absent or of another type
     */
    template <typename T> std::shared_ptr<const T> getStateAs() const {
        return std::dynamic_pointer_cast<const T>(state_);
    }

    Session withState(StatePtr state) const;

    std::string toString() const;

private:
    SessionId id_;
    StatePtr state_;
    Vars vars_;
};

}  // namespace SFR
