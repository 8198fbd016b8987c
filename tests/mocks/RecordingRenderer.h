#pragma once

#include "model/Event.h"
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace SFR {
namespace Test {

/**
 * @brief Thread-safe sink shared by all renderers of one test
 */
class Outbox {
public:
    void record(const SessionId &sessionId, const std::string &text) {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.emplace_back(sessionId, text);
    }

    std::vector<std::string> textsFor(const SessionId &sessionId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> texts;
        for (const auto &[id, text] : messages_) {
            if (id == sessionId) {
                texts.push_back(text);
            }
        }
        return texts;
    }

    std::vector<std::pair<SessionId, std::string>> all() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<SessionId, std::string>> messages_;
};

/**
 * @brief Renderer scoped to the session of one event
 */
class RecordingRenderer {
public:
    RecordingRenderer(std::shared_ptr<Outbox> outbox, SessionId sessionId)
        : outbox_(std::move(outbox)), sessionId_(std::move(sessionId)) {}

    void send(const std::string &text) {
        outbox_->record(sessionId_, text);
    }

    const SessionId &getSessionId() const {
        return sessionId_;
    }

private:
    std::shared_ptr<Outbox> outbox_;
    SessionId sessionId_;
};

}  // namespace Test
}  // namespace SFR
