#pragma once

#include "model/TypeHierarchy.h"
#include "runtime/Controller.h"
#include <cstddef>
#include <memory>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace SFR {

/**
 * @brief Lookup table (event type, state selector) -> Controller
 *
 * A selector is either nothing (any state), a state type, or an exact state
 * value. Registering the same (event type, selector) twice replaces the
 * earlier controller.
 *
 * resolve() walks the event's type ancestry from most to least specific.
 * For each event type it tries, in order: the exact state value, every type
 * in the state's own ancestry, and finally the any-state binding. State
 * precision is therefore exhausted before the event type is generalized.
 */
class ControllerRegistry {
public:
    ControllerRegistry(std::shared_ptr<const TypeHierarchy> eventTypes,
                       std::shared_ptr<const TypeHierarchy> stateTypes);

    /**
     * @brief Bind a controller for any state of the session
     */
    void put(std::type_index eventType, Controller controller);

    /**
     * @brief Bind a controller for states of stateType or of any type below it
     */
    void put(std::type_index eventType, std::type_index stateType, Controller controller);

    /**
     * @brief Bind a controller for states equal to state
     */
    void put(std::type_index eventType, StatePtr state, Controller controller);

    /**
     * @brief Most specific controller for the event's dynamic type and state
     * @throws FlowException (ErrorKind::Dispatch) if nothing matches
     */
    const Controller &resolve(const Event &event, const StatePtr &state) const;

    /**
     * @brief Non-throwing variant of resolve()
     */
    const Controller *find(const Event &event, const StatePtr &state) const;

    size_t size() const;

private:
    struct Bindings {
        std::vector<std::pair<StatePtr, Controller>> byValue;
        std::unordered_map<std::type_index, Controller> byStateType;
        Controller anyState;
    };

    static void requireController(const Controller &controller);

    std::shared_ptr<const TypeHierarchy> eventTypes_;
    std::shared_ptr<const TypeHierarchy> stateTypes_;
    std::unordered_map<std::type_index, Bindings> bindings_;
};

}  // namespace SFR
