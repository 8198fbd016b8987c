#pragma once

#include <memory>
#include <string>

namespace SFR {

using SessionId = std::string;

/**
 * @brief Root of all inbound event types
 *
 * An event belongs to exactly one session and is immutable once emitted.
 * Dispatch uses the event's dynamic type (typeid), walked through the
 * event TypeHierarchy up to this root.
 */
class Event {
public:
    explicit Event(SessionId sessionId);
    virtual ~Event() = default;

    const SessionId &getSessionId() const {
        return sessionId_;
    }

    /**
     * @brief Human readable description used in logs
     */
    virtual std::string toString() const;

private:
    SessionId sessionId_;
};

using EventPtr = std::shared_ptr<const Event>;

}  // namespace SFR
