#include "model/Session.h"

namespace SFR {

Session::Session(SessionId id, StatePtr state, Vars vars)
    : id_(std::move(id)), state_(std::move(state)), vars_(std::move(vars)) {}

Session Session::of(const SessionId &id, StateAndVars stateAndVars) {
    return Session(id, std::move(stateAndVars.state), std::move(stateAndVars.vars));
}

Session Session::withState(StatePtr state) const {
    return Session(id_, std::move(state), vars_);
}

std::string Session::toString() const {
    return "Session{id=" + id_ + ", state=" + describeState(state_) + ", vars=" + std::to_string(vars_.size()) + "}";
}

}  // namespace SFR
