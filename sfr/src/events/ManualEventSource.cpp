#include "events/ManualEventSource.h"
#include "common/LogUtils.h"
#include "common/Logger.h"

namespace SFR {

void ManualEventSource::onEvent(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (callback_) {
        LOG_WARN("ManualEventSource: Replacing previously registered event callback");
    }
    callback_ = std::move(callback);
}

bool ManualEventSource::publish(const EventPtr &event) {
    if (!event) {
        LOG_WARN("ManualEventSource: Ignoring null event");
        return false;
    }

    EventCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = callback_;
    }

    if (!callback) {
        LOG_WARN("ManualEventSource: No subscriber, dropping event {}", Log::sanitize(event->toString()));
        return false;
    }

    callback(event);
    return true;
}

bool ManualEventSource::hasSubscriber() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(callback_);
}

}  // namespace SFR
