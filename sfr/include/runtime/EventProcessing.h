#pragma once

#include "common/FlowErrors.h"
#include "common/LogUtils.h"
#include "common/Logger.h"
#include "runtime/FlowConfig.h"
#include "runtime/FlowStage.h"
#include <atomic>
#include <exception>
#include <memory>
#include <optional>

namespace SFR {

/**
 * @brief Pipeline of one event: lock -> load -> dispatch -> transition -> bind view -> store -> render -> unlock
 *
 * Each stage starts an asynchronous collaborator call and continues in its
 * completion, on whatever thread delivers it. The current FlowStage guards
 * every continuation, so a completion that arrives twice or after the
 * pipeline failed is ignored instead of running a stage again.
 *
 * Any failure after the lock was taken renders the failure view and then
 * releases the lock. A failed lock acquire renders the failure view only if
 * unlocked rendering is allowed, and never releases.
 */
template <typename Renderer> class EventProcessing : public std::enable_shared_from_this<EventProcessing<Renderer>> {
public:
    using Config = FlowConfig<Renderer>;

    EventProcessing(std::shared_ptr<const Config> config, EventPtr event)
        : config_(std::move(config)), event_(std::move(event)) {}

    /**
     * @brief Idle -> LockPending
     */
    void start() {
        if (!advance(FlowStage::Idle, FlowStage::LockPending)) {
            LOG_WARN("EventProcessing: Event {} already started (stage {})", describeEvent(), toString(getStage()));
            return;
        }

        auto self = this->shared_from_this();
        try {
            config_->sessionStorage->acquireLock(event_->getSessionId(),
                                                 [self](std::exception_ptr error) { self->onLockAcquired(error); });
        } catch (...) {
            failStage(ErrorKind::LockAcquisition, std::current_exception());
        }
    }

    /**
     * @brief The executor refused the event; handled like a failed lock acquire
     */
    void rejectSubmission(std::exception_ptr error) {
        failWithoutLock(ErrorKind::Submission, error);
    }

    FlowStage getStage() const {
        return stage_.load();
    }

private:
    void onLockAcquired(std::exception_ptr error) {
        if (error) {
            if (getStage() == FlowStage::LockPending) {
                failWithoutLock(ErrorKind::LockAcquisition, error);
            } else {
                LOG_WARN("EventProcessing: Ignoring late lock failure for event {}", describeEvent());
            }
            return;
        }

        lockHeld_ = true;
        if (!advance(FlowStage::LockPending, FlowStage::LockAcquired)) {
            // Granted after this event already gave up on it: hand it straight back
            LOG_WARN("EventProcessing: Lock for session '{}' granted in stage {}, releasing", event_->getSessionId(),
                     toString(getStage()));
            releaseLock();
            return;
        }

        auto self = this->shared_from_this();
        try {
            config_->sessionStorage->loadStateAndVars(
                event_->getSessionId(),
                [self](StageResult<StateAndVars> result) { self->onStateAndVarsLoaded(std::move(result)); });
        } catch (...) {
            fail(ErrorKind::StateLoad, std::current_exception());
        }
    }

    void onStateAndVarsLoaded(StageResult<StateAndVars> result) {
        if (!expect(FlowStage::LockAcquired, "state load")) {
            return;
        }
        if (result.isError()) {
            fail(ErrorKind::StateLoad, result.getError());
            return;
        }

        session_ = Session::of(event_->getSessionId(), result.takeValue());
        advance(FlowStage::LockAcquired, FlowStage::Loaded);
        dispatch();
    }

    void dispatch() {
        // Copied: the controller may complete synchronously, replacing session_
        StatePtr state = session_->getState();

        const Controller *controller = nullptr;
        try {
            controller = state ? &config_->controllers->resolve(*event_, state) : &config_->initialController;
        } catch (...) {
            fail(ErrorKind::Dispatch, std::current_exception());
            return;
        }

        advance(FlowStage::Loaded, FlowStage::Dispatched);
        LOG_TRACE("EventProcessing: Dispatching event {} in state {}", describeEvent(),
                  Log::sanitize(describeState(state)));

        auto self = this->shared_from_this();
        try {
            (*controller)(event_, state,
                          [self](StageResult<StatePtr> result) { self->onTransitionPerformed(std::move(result)); });
        } catch (...) {
            fail(ErrorKind::Transition, std::current_exception());
        }
    }

    void onTransitionPerformed(StageResult<StatePtr> result) {
        if (!expect(FlowStage::Dispatched, "transition")) {
            return;
        }
        if (result.isError()) {
            fail(ErrorKind::Transition, result.getError());
            return;
        }

        StatePtr newState = result.getValue();
        try {
            view_ = config_->views->resolve(newState);
        } catch (...) {
            fail(ErrorKind::ViewBinding, std::current_exception());
            return;
        }

        session_ = session_->withState(std::move(newState));
        advance(FlowStage::Dispatched, FlowStage::Transitioned);

        auto self = this->shared_from_this();
        try {
            config_->sessionStorage->store(*session_,
                                           [self](std::exception_ptr error) { self->onSessionStored(error); });
        } catch (...) {
            fail(ErrorKind::Store, std::current_exception());
        }
    }

    void onSessionStored(std::exception_ptr error) {
        if (!expect(FlowStage::Transitioned, "store")) {
            return;
        }
        if (error) {
            fail(ErrorKind::Store, error);
            return;
        }

        LOG_DEBUG("EventProcessing: Set new state for session '{}': {}", event_->getSessionId(),
                  Log::sanitize(describeState(session_->getState())));
        advance(FlowStage::Transitioned, FlowStage::Stored);

        auto self = this->shared_from_this();
        try {
            renderer_ = std::make_unique<Renderer>(config_->rendererFactory(event_));
            view_(*session_, *renderer_, event_, [self](std::exception_ptr error) { self->onViewRendered(error); });
        } catch (...) {
            fail(ErrorKind::Render, std::current_exception());
        }
    }

    void onViewRendered(std::exception_ptr error) {
        if (!expect(FlowStage::Stored, "render")) {
            return;
        }
        if (error) {
            fail(ErrorKind::Render, error);
            return;
        }

        advance(FlowStage::Stored, FlowStage::Rendered);
        releaseLock();
    }

    // === Failure path ===

    void failStage(ErrorKind kind, std::exception_ptr error) {
        if (lockHeld_) {
            fail(kind, error);
        } else {
            failWithoutLock(kind, error);
        }
    }

    void fail(ErrorKind kind, std::exception_ptr error) {
        if (!enterFailed(kind, error)) {
            return;
        }

        auto self = this->shared_from_this();
        renderFailure([self](std::exception_ptr renderError) {
            self->onFailureRendered(renderError);
            self->releaseLock();
        });
    }

    void failWithoutLock(ErrorKind kind, std::exception_ptr error) {
        if (!enterFailed(kind, error)) {
            return;
        }

        if (!config_->allowUnlockedRendering) {
            complete(FlowStage::Failed);
            return;
        }

        auto self = this->shared_from_this();
        renderFailure([self](std::exception_ptr renderError) {
            self->onFailureRendered(renderError);
            self->complete(self->getStage());
        });
    }

    bool enterFailed(ErrorKind kind, std::exception_ptr error) {
        FlowStage current = stage_.load();
        while (true) {
            if (current == FlowStage::Failed || current == FlowStage::FailureRendered ||
                current == FlowStage::Rendered || current == FlowStage::Unlocked) {
                LOG_WARN("EventProcessing: Ignoring {} for event {}, pipeline already in stage {}: {}",
                         toString(kind), describeEvent(), toString(current), describeException(error));
                return false;
            }
            if (stage_.compare_exchange_weak(current, FlowStage::Failed)) {
                break;
            }
        }

        failure_ = FlowException::wrap(kind, error);
        LOG_ERROR("EventProcessing: {} for event {}. Cause: {}", toString(kind), describeEvent(),
                  describeException(failure_));
        return true;
    }

    void renderFailure(Completion done) {
        FailureContext context{failure_, FlowException::kindOf(failure_, ErrorKind::Render), event_, session_};
        try {
            failureRenderer_ = std::make_unique<Renderer>(config_->rendererFactory(event_));
            config_->failureView(context, *failureRenderer_, done);
        } catch (...) {
            done(std::current_exception());
        }
    }

    void onFailureRendered(std::exception_ptr renderError) {
        if (renderError) {
            LOG_ERROR("EventProcessing: {} while reporting '{}'. Event: {}",
                      describeException(FlowException::wrap(ErrorKind::FailureRender, renderError)),
                      describeException(failure_), describeEvent());
        }
        advance(FlowStage::Failed, FlowStage::FailureRendered);
    }

    void releaseLock() {
        if (!lockHeld_ || releaseIssued_.exchange(true)) {
            return;
        }

        const SessionId &sessionId = event_->getSessionId();
        FlowStage lastStage = getStage();
        LOG_DEBUG("EventProcessing: Releasing session lock. Session ID: '{}'", sessionId);

        auto self = this->shared_from_this();
        try {
            config_->sessionStorage->releaseLock(sessionId, [self, lastStage](std::exception_ptr error) {
                if (error) {
                    LOG_ERROR("EventProcessing: Failed to release session lock. Session ID: '{}'. Cause: {}",
                              self->event_->getSessionId(), describeException(error));
                }
                self->stage_.store(FlowStage::Unlocked);
                self->complete(lastStage);
            });
        } catch (...) {
            LOG_ERROR("EventProcessing: Failed to release session lock. Session ID: '{}'. Cause: {}", sessionId,
                      describeException(std::current_exception()));
            stage_.store(FlowStage::Unlocked);
            complete(lastStage);
        }
    }

    void complete(FlowStage lastStage) {
        if (completed_.exchange(true)) {
            return;
        }

        for (const auto &observer : config_->observers) {
            try {
                observer->onEventCompleted(event_, lastStage, failure_);
            } catch (const std::exception &e) {
                LOG_ERROR("EventProcessing: Observer threw for event {}: {}", describeEvent(), e.what());
            } catch (...) {
                LOG_ERROR("EventProcessing: Observer threw an unknown exception for event {}", describeEvent());
            }
        }
    }

    // === Stage bookkeeping ===

    bool advance(FlowStage from, FlowStage to) {
        return stage_.compare_exchange_strong(from, to);
    }

    bool expect(FlowStage expected, const char *completion) {
        FlowStage current = getStage();
        if (current != expected) {
            LOG_WARN("EventProcessing: Ignoring {} completion for event {} in stage {}", completion, describeEvent(),
                     toString(current));
            return false;
        }
        return true;
    }

    std::string describeEvent() const {
        return Log::sanitize(event_->toString());
    }

    std::shared_ptr<const Config> config_;
    EventPtr event_;

    std::atomic<FlowStage> stage_{FlowStage::Idle};
    std::atomic<bool> lockHeld_{false};
    std::atomic<bool> releaseIssued_{false};
    std::atomic<bool> completed_{false};

    std::optional<Session> session_;
    View<Renderer> view_;
    std::unique_ptr<Renderer> renderer_;
    std::unique_ptr<Renderer> failureRenderer_;
    std::exception_ptr failure_;
};

}  // namespace SFR
