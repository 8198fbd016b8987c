#include "model/State.h"
#include "model/TypeHierarchy.h"
#include <typeindex>

namespace SFR {

std::string State::toString() const {
    return TypeHierarchy::typeName(std::type_index(typeid(*this)));
}

NamedState::NamedState(std::string name) : name_(std::move(name)) {}

bool NamedState::equals(const State &other) const {
    if (typeid(*this) != typeid(other)) {
        return false;
    }
    return name_ == static_cast<const NamedState &>(other).name_;
}

std::string NamedState::toString() const {
    return name_;
}

bool sameState(const StatePtr &lhs, const StatePtr &rhs) {
    if (!lhs || !rhs) {
        return !lhs && !rhs;
    }
    return lhs->equals(*rhs);
}

std::string describeState(const StatePtr &state) {
    return state ? state->toString() : "<none>";
}

}  // namespace SFR
