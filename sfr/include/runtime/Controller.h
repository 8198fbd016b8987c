#pragma once

#include "common/Completion.h"
#include "model/Event.h"
#include "model/State.h"
#include <functional>

namespace SFR {

using StateCallback = ResultCallback<StatePtr>;

/**
 * @brief Transition function: (event, fromState) -> new state, asynchronously
 *
 * fromState is null for the initial controller. The callback must be
 * invoked exactly once; throwing from the controller itself is reported as
 * a transition failure.
 */
using Controller = std::function<void(const EventPtr &, const StatePtr &, StateCallback)>;

}  // namespace SFR
