#pragma once

#include "model/Event.h"
#include "runtime/FlowStage.h"
#include <exception>

namespace SFR {

/**
 * @brief Observer notified once per submitted event when its pipeline ends
 *
 * Called after the session lock was released (or, for a failed lock
 * acquire, after the optional unlocked failure rendering). error is null
 * for a successful event. Exceptions thrown by observers are logged and
 * ignored.
 */
class IFlowObserver {
public:
    virtual ~IFlowObserver() = default;

    virtual void onEventCompleted(const EventPtr &event, FlowStage lastStage, std::exception_ptr error) = 0;
};

}  // namespace SFR
