#include "model/Event.h"
#include "model/TypeHierarchy.h"
#include <typeindex>

namespace SFR {

Event::Event(SessionId sessionId) : sessionId_(std::move(sessionId)) {}

std::string Event::toString() const {
    return TypeHierarchy::typeName(std::type_index(typeid(*this))) + "{session=" + sessionId_ + "}";
}

}  // namespace SFR
