#pragma once

#include "common/FlowErrors.h"
#include "model/Event.h"
#include "model/Session.h"
#include <exception>
#include <optional>
#include <string>

namespace SFR {

/**
 * @brief Everything the failure view gets to see about a failed event
 *
 * session is the session as of the failing stage: absent when the lock or
 * the load failed, the loaded session for dispatch/transition/view-binding
 * failures, and the transitioned session for store/render failures.
 */
struct FailureContext {
    std::exception_ptr error;
    ErrorKind kind;
    EventPtr event;
    std::optional<Session> session;

    std::string getMessage() const {
        return describeException(error);
    }
};

}  // namespace SFR
