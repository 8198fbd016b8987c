#pragma once

#include "common/Completion.h"
#include "common/FlowErrors.h"
#include "model/TypeHierarchy.h"
#include "runtime/Controller.h"
#include "runtime/ViewRegistry.h"
#include <memory>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace SFR::Adapters {

template <typename> inline constexpr bool unsupportedSignature = false;

template <typename E> std::shared_ptr<const E> castEvent(const EventPtr &event) {
    if constexpr (std::is_same_v<E, Event>) {
        return event;
    } else {
        auto typed = std::dynamic_pointer_cast<const E>(event);
        if (!typed) {
            throw FlowException(ErrorKind::Transition, "Event " + TypeHierarchy::typeName(typeid(*event)) +
                                                           " is not a " + TypeHierarchy::typeName(typeid(E)));
        }
        return typed;
    }
}

// An absent state stays absent; only a present state of the wrong type is an error
template <typename S> std::shared_ptr<const S> castState(const StatePtr &state) {
    if constexpr (std::is_same_v<S, State>) {
        return state;
    } else {
        if (!state) {
            return nullptr;
        }
        auto typed = std::dynamic_pointer_cast<const S>(state);
        if (!typed) {
            throw FlowException(ErrorKind::Transition, "State " + TypeHierarchy::typeName(typeid(*state)) +
                                                           " is not a " + TypeHierarchy::typeName(typeid(S)));
        }
        return typed;
    }
}

/**
 * @brief Wrap a typed controller into the erased Controller signature
 *
 * Accepted forms, with EP = std::shared_ptr<const E> and SP = std::shared_ptr<const S>:
 *   void(EP, SP, StateCallback)   asynchronous
 *   void(EP, StateCallback)       asynchronous, state ignored
 *   StatePtr(EP, SP)              synchronous
 *   StatePtr(EP)                  synchronous, state ignored
 * A synchronous controller that throws fails the transition.
 */
template <typename E, typename S, typename F> Controller makeController(F fn) {
    using EventArg = const std::shared_ptr<const E> &;
    using StateArg = const std::shared_ptr<const S> &;

    static_assert(std::is_invocable_v<F &, EventArg, StateArg, StateCallback> ||
                      std::is_invocable_v<F &, EventArg, StateCallback> ||
                      std::is_invocable_r_v<StatePtr, F &, EventArg, StateArg> ||
                      std::is_invocable_r_v<StatePtr, F &, EventArg>,
                  "unsupported controller signature");

    return [fn = std::move(fn)](const EventPtr &event, const StatePtr &state, StateCallback done) mutable {
        auto typedEvent = castEvent<E>(event);

        if constexpr (std::is_invocable_v<F &, EventArg, StateArg, StateCallback>) {
            fn(typedEvent, castState<S>(state), std::move(done));
        } else if constexpr (std::is_invocable_v<F &, EventArg, StateCallback>) {
            fn(typedEvent, std::move(done));
        } else if constexpr (std::is_invocable_r_v<StatePtr, F &, EventArg, StateArg>) {
            StatePtr next = fn(typedEvent, castState<S>(state));
            done(StageResult<StatePtr>::createSuccess(std::move(next)));
        } else {
            StatePtr next = fn(typedEvent);
            done(StageResult<StatePtr>::createSuccess(std::move(next)));
        }
    };
}

/**
 * @brief Wrap a view into the erased View signature
 *
 * Accepted forms, with SP = std::shared_ptr<const S>:
 *   void(const Session &, R &, const EventPtr &, Completion)
 *   void(SP, R &, const EventPtr &, Completion)
 *   void(const Session &, R &, const EventPtr &)
 *   void(SP, R &, const EventPtr &)
 */
template <typename Renderer, typename S, typename F> View<Renderer> makeView(F fn) {
    using StateArg = const std::shared_ptr<const S> &;

    return [fn = std::move(fn)](const Session &session, Renderer &renderer, const EventPtr &event,
                                Completion done) mutable {
        if constexpr (std::is_invocable_v<F &, const Session &, Renderer &, const EventPtr &, Completion>) {
            fn(session, renderer, event, std::move(done));
        } else if constexpr (std::is_invocable_v<F &, StateArg, Renderer &, const EventPtr &, Completion>) {
            fn(castState<S>(session.getState()), renderer, event, std::move(done));
        } else if constexpr (std::is_invocable_v<F &, const Session &, Renderer &, const EventPtr &>) {
            fn(session, renderer, event);
            done(nullptr);
        } else if constexpr (std::is_invocable_v<F &, StateArg, Renderer &, const EventPtr &>) {
            fn(castState<S>(session.getState()), renderer, event);
            done(nullptr);
        } else {
            static_assert(unsupportedSignature<F>, "unsupported view signature");
        }
    };
}

/**
 * @brief Accepts void(const FailureContext &, R &, Completion) or void(const FailureContext &, R &)
 */
template <typename Renderer, typename F> FailureView<Renderer> makeFailureView(F fn) {
    return [fn = std::move(fn)](const FailureContext &failure, Renderer &renderer, Completion done) mutable {
        if constexpr (std::is_invocable_v<F &, const FailureContext &, Renderer &, Completion>) {
            fn(failure, renderer, std::move(done));
        } else if constexpr (std::is_invocable_v<F &, const FailureContext &, Renderer &>) {
            fn(failure, renderer);
            done(nullptr);
        } else {
            static_assert(unsupportedSignature<F>, "unsupported failure view signature");
        }
    };
}

}  // namespace SFR::Adapters
