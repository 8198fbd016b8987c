#include "runtime/ControllerRegistry.h"
#include "common/FlowErrors.h"
#include "common/LogUtils.h"
#include "common/Logger.h"

namespace SFR {

ControllerRegistry::ControllerRegistry(std::shared_ptr<const TypeHierarchy> eventTypes,
                                       std::shared_ptr<const TypeHierarchy> stateTypes)
    : eventTypes_(std::move(eventTypes)), stateTypes_(std::move(stateTypes)) {
    if (!eventTypes_ || !stateTypes_) {
        throw FlowConfigurationError("ControllerRegistry requires event and state type hierarchies");
    }
}

void ControllerRegistry::put(std::type_index eventType, Controller controller) {
    requireController(controller);
    bindings_[eventType].anyState = std::move(controller);
}

void ControllerRegistry::put(std::type_index eventType, std::type_index stateType, Controller controller) {
    requireController(controller);
    bindings_[eventType].byStateType.insert_or_assign(stateType, std::move(controller));
}

void ControllerRegistry::put(std::type_index eventType, StatePtr state, Controller controller) {
    requireController(controller);
    if (!state) {
        throw FlowConfigurationError("Exact-state binding requires a state value; use the initial controller for "
                                     "sessions without state");
    }

    auto &byValue = bindings_[eventType].byValue;
    for (auto &binding : byValue) {
        if (binding.first->equals(*state)) {
            binding.second = std::move(controller);
            return;
        }
    }
    byValue.emplace_back(std::move(state), std::move(controller));
}

const Controller &ControllerRegistry::resolve(const Event &event, const StatePtr &state) const {
    const Controller *controller = find(event, state);
    if (!controller) {
        throw FlowException(ErrorKind::Dispatch,
                            "No controller registered for state " + Log::sanitize(describeState(state)) +
                                " and event class " + TypeHierarchy::typeName(std::type_index(typeid(event))));
    }
    return *controller;
}

const Controller *ControllerRegistry::find(const Event &event, const StatePtr &state) const {
    std::vector<std::type_index> stateAncestry;
    if (state) {
        stateAncestry = stateTypes_->ancestry(std::type_index(typeid(*state)));
    }

    for (const auto &eventType : eventTypes_->ancestry(std::type_index(typeid(event)))) {
        auto it = bindings_.find(eventType);
        if (it == bindings_.end()) {
            continue;
        }
        const Bindings &bindings = it->second;

        if (state) {
            for (const auto &binding : bindings.byValue) {
                if (binding.first->equals(*state)) {
                    return &binding.second;
                }
            }

            for (const auto &stateType : stateAncestry) {
                auto typed = bindings.byStateType.find(stateType);
                if (typed != bindings.byStateType.end()) {
                    return &typed->second;
                }
            }
        }

        if (bindings.anyState) {
            return &bindings.anyState;
        }
    }

    LOG_DEBUG("ControllerRegistry: No match for event {} in state {}", TypeHierarchy::typeName(typeid(event)),
              Log::sanitize(describeState(state)));
    return nullptr;
}

size_t ControllerRegistry::size() const {
    size_t count = 0;
    for (const auto &[eventType, bindings] : bindings_) {
        count += bindings.byValue.size() + bindings.byStateType.size() + (bindings.anyState ? 1 : 0);
    }
    return count;
}

void ControllerRegistry::requireController(const Controller &controller) {
    if (!controller) {
        throw FlowConfigurationError("Cannot register an empty controller");
    }
}

}  // namespace SFR
