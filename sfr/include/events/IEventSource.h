#pragma once

#include "model/Event.h"
#include <functional>

namespace SFR {

using EventCallback = std::function<void(const EventPtr &)>;

/**
 * @brief Transport that produces inbound events
 *
 * onEvent() registers the single callback invoked once per inbound event.
 * Registration must not block; the callback may be invoked from the
 * source's own threads.
 */
class IEventSource {
public:
    virtual ~IEventSource() = default;

    virtual void onEvent(EventCallback callback) = 0;
};

}  // namespace SFR
