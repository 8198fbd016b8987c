#pragma once

#include "events/IEventSource.h"
#include <mutex>

namespace SFR {

/**
 * @brief In-process event source fed by publish()
 *
 * Useful for embedding a flow behind an existing transport loop, for
 * examples and for tests.
 */
class ManualEventSource : public IEventSource {
public:
    void onEvent(EventCallback callback) override;

    /**
     * @brief Deliver an event to the registered callback on the calling thread
     * @return false if no callback is registered or the event is null
     */
    bool publish(const EventPtr &event);

    bool hasSubscriber() const;

private:
    mutable std::mutex mutex_;
    EventCallback callback_;
};

}  // namespace SFR
