// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-SFR-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of SFR (Session Flow Runtime).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: https://github.com/newmassrael/scxml-core-engine/blob/main/LICENSE
#pragma once

#include "common/LogUtils.h"
#include "common/Logger.h"
#include "runtime/EventProcessing.h"
#include "runtime/FlowConfig.h"
#include <atomic>
#include <memory>

namespace SFR {

/**
 * @brief Event-driven session state machine runtime
 *
 * Routes each inbound event of a session to the controller selected by the
 * event type and the session's current state, persists the new state,
 * renders it, and releases the session lock. Events of different sessions
 * run in parallel (subject to the executor); events of one session are
 * serialized by the storage lock.
 *
 * The Flow must outlive the subscription; events published after it is
 * destroyed are dropped.
 *
 * Outcomes are side effects only: storage writes, rendered output, log
 * records and IFlowObserver notifications. Nothing is thrown back to the
 * event source.
 *
 * @code
 * auto flow = SFR::FlowBuilder<Reply>()
 *                 .eventSource(source)
 *                 .rendererFactory([](const SFR::EventPtr &e) { return Reply(e); })
 *                 .initial([](const SFR::EventPtr &) { return std::make_shared<Greeting>(); })
 *                 .render<Greeting>().as([](const auto &, Reply &out, const SFR::EventPtr &) { out.send("hello"); })
 *                 .failView([](const SFR::FailureContext &f, Reply &out) { out.send(f.getMessage()); })
 *                 .build();
 * @endcode
 */
template <typename Renderer> class Flow {
public:
    /**
     * @throws FlowConfigurationError if a required collaborator is missing
     */
    explicit Flow(FlowConfig<Renderer> config) : config_(validated(std::move(config))) {}

    Flow(const Flow &) = delete;
    Flow &operator=(const Flow &) = delete;

    /**
     * @brief Subscribe to the event source; further calls are no-ops
     */
    void init() {
        if (initialized_.exchange(true)) {
            LOG_DEBUG("Flow: Already subscribed to event source");
            return;
        }

        // The configuration owns the event source, so the subscription must not own the configuration
        std::weak_ptr<const FlowConfig<Renderer>> weakConfig = config_;
        config_->eventSource->onEvent([weakConfig](const EventPtr &event) {
            auto config = weakConfig.lock();
            if (!config) {
                LOG_WARN("Flow: Dropping event {}, flow no longer exists",
                         event ? Log::sanitize(event->toString()) : std::string("<null>"));
                return;
            }
            submitTo(config, event);
        });
        LOG_DEBUG("Flow: Subscribed to event source");
    }

    /**
     * @brief Process an event; returns once the pipeline is handed to the executor
     */
    void submit(const EventPtr &event) {
        submitTo(config_, event);
    }

    bool isInitialized() const {
        return initialized_.load();
    }

    const FlowConfig<Renderer> &getConfig() const {
        return *config_;
    }

private:
    static std::shared_ptr<const FlowConfig<Renderer>> validated(FlowConfig<Renderer> config) {
        config.validate();
        return std::make_shared<const FlowConfig<Renderer>>(std::move(config));
    }

    static void submitTo(const std::shared_ptr<const FlowConfig<Renderer>> &config, const EventPtr &event) {
        if (!event) {
            LOG_ERROR("Flow: Dropping null event");
            return;
        }

        LOG_DEBUG("Flow: Received event: {}", Log::sanitize(event->toString()));
        auto processing = std::make_shared<EventProcessing<Renderer>>(config, event);
        try {
            config->executor->execute([processing] { processing->start(); });
        } catch (...) {
            processing->rejectSubmission(std::current_exception());
        }
    }

    std::shared_ptr<const FlowConfig<Renderer>> config_;
    std::atomic<bool> initialized_{false};
};

}  // namespace SFR
