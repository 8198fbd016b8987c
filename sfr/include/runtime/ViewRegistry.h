#pragma once

#include "common/Completion.h"
#include "common/FlowErrors.h"
#include "common/LogUtils.h"
#include "model/Session.h"
#include "model/TypeHierarchy.h"
#include "runtime/FailureContext.h"
#include <functional>
#include <memory>
#include <typeindex>
#include <unordered_map>

namespace SFR {

/**
 * @brief Renders a session after a successful transition
 *
 * The renderer is created for this event only. The completion must be
 * invoked exactly once.
 */
template <typename Renderer>
using View = std::function<void(const Session &, Renderer &, const EventPtr &, Completion)>;

/**
 * @brief Renders a pipeline failure to the event's output channel
 */
template <typename Renderer> using FailureView = std::function<void(const FailureContext &, Renderer &, Completion)>;

/**
 * @brief Binding state type -> View, resolved through the state type ancestry
 */
template <typename Renderer> class ViewRegistry {
public:
    explicit ViewRegistry(std::shared_ptr<const TypeHierarchy> stateTypes) : stateTypes_(std::move(stateTypes)) {
        if (!stateTypes_) {
            throw FlowConfigurationError("ViewRegistry requires a state type hierarchy");
        }
    }

    void put(std::type_index stateType, View<Renderer> view) {
        if (!view) {
            throw FlowConfigurationError("Cannot register an empty view for " + TypeHierarchy::typeName(stateType));
        }
        views_.insert_or_assign(stateType, std::move(view));
    }

    /**
     * @brief View bound to the state's dynamic type or its nearest declared ancestor
     * @throws FlowException (ErrorKind::ViewBinding) if the state is absent or nothing matches
     */
    const View<Renderer> &resolve(const StatePtr &state) const {
        if (!state) {
            throw FlowException(ErrorKind::ViewBinding, "Controller produced no state; nothing to render");
        }

        std::type_index stateType(typeid(*state));
        for (const auto &type : stateTypes_->ancestry(stateType)) {
            auto it = views_.find(type);
            if (it != views_.end()) {
                return it->second;
            }
        }

        throw FlowException(ErrorKind::ViewBinding, "No view defined for state class " +
                                                        TypeHierarchy::typeName(stateType) + " (state " +
                                                        Log::sanitize(state->toString()) + ")");
    }

    bool contains(std::type_index stateType) const {
        return views_.find(stateType) != views_.end();
    }

    size_t size() const {
        return views_.size();
    }

private:
    std::shared_ptr<const TypeHierarchy> stateTypes_;
    std::unordered_map<std::type_index, View<Renderer>> views_;
};

}  // namespace SFR
