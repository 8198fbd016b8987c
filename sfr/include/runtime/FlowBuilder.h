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

#include "common/FlowErrors.h"
#include "common/FlowOptions.h"
#include "common/Logger.h"
#include "runtime/Adapters.h"
#include "runtime/Flow.h"
#include "runtime/InlineExecutor.h"
#include "runtime/ThreadPoolExecutor.h"
#include "storage/InMemorySessionStorage.h"
#include <memory>
#include <optional>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

namespace SFR {

/**
 * @brief Fluent registration surface for a Flow
 *
 * Controllers, views and type declarations are collected into registries
 * owned by the builder until build() hands them to the Flow. Any call on a
 * builder after build() throws FlowConfigurationError.
 *
 * Defaults: inline executor (or a worker pool when FlowOptions asks for
 * workerThreads), InMemorySessionStorage, unlocked rendering disabled.
 */
template <typename Renderer> class FlowBuilder {
public:
    FlowBuilder()
        : eventTypes_(std::make_shared<TypeHierarchy>(TypeHierarchy::rootedAt<Event>())),
          stateTypes_(std::make_shared<TypeHierarchy>(TypeHierarchy::rootedAt<State>())),
          controllers_(std::make_shared<ControllerRegistry>(eventTypes_, stateTypes_)),
          views_(std::make_shared<ViewRegistry<Renderer>>(stateTypes_)) {}

    FlowBuilder(FlowBuilder &&) = default;
    FlowBuilder &operator=(FlowBuilder &&) = default;

    /**
     * @brief Controller binding restricted to a state type or a state value
     */
    template <typename E, typename S> class When {
    public:
        When(FlowBuilder &builder, StatePtr value) : builder_(builder), value_(std::move(value)) {}

        template <typename F> FlowBuilder &with(F controller) {
            builder_.checkMutable();
            auto erased = Adapters::makeController<E, S>(std::move(controller));
            if (value_) {
                builder_.controllers_->put(typeid(E), value_, std::move(erased));
            } else {
                builder_.controllers_->put(typeid(E), typeid(S), std::move(erased));
            }
            return builder_;
        }

        template <typename F> FlowBuilder &by(F controller) {
            return with(std::move(controller));
        }

    private:
        FlowBuilder &builder_;
        StatePtr value_;
    };

    /**
     * @brief Controller binding for one event type
     */
    template <typename E> class Handle {
    public:
        explicit Handle(FlowBuilder &builder) : builder_(builder) {}

        /**
         * @brief Bind for any state of the session
         */
        template <typename F> FlowBuilder &with(F controller) {
            builder_.checkMutable();
            builder_.controllers_->put(typeid(E), Adapters::makeController<E, State>(std::move(controller)));
            return builder_;
        }

        template <typename F> FlowBuilder &by(F controller) {
            return with(std::move(controller));
        }

        template <typename S> When<E, S> when() {
            static_assert(std::is_base_of_v<State, S>, "state selector must derive from SFR::State");
            return When<E, S>(builder_, nullptr);
        }

        /**
         * @brief Bind for states equal to value (State::equals)
         */
        template <typename S> When<E, std::remove_const_t<S>> when(std::shared_ptr<S> value) {
            static_assert(std::is_base_of_v<State, std::remove_const_t<S>>,
                          "state selector must derive from SFR::State");
            if (!value) {
                throw FlowConfigurationError("Cannot bind a controller to an absent state value");
            }
            return When<E, std::remove_const_t<S>>(builder_, std::move(value));
        }

    private:
        FlowBuilder &builder_;
    };

    /**
     * @brief View binding for one or more state types
     */
    template <typename S> class Render {
    public:
        Render(FlowBuilder &builder, std::vector<std::type_index> stateTypes)
            : builder_(builder), stateTypes_(std::move(stateTypes)) {}

        template <typename F> FlowBuilder &as(F view) {
            builder_.checkMutable();
            auto erased = Adapters::makeView<Renderer, S>(std::move(view));
            for (const auto &stateType : stateTypes_) {
                builder_.views_->put(stateType, erased);
            }
            return builder_;
        }

    private:
        FlowBuilder &builder_;
        std::vector<std::type_index> stateTypes_;
    };

    template <typename E> Handle<E> handle() {
        static_assert(std::is_base_of_v<Event, E>, "handled type must derive from SFR::Event");
        checkMutable();
        return Handle<E>(*this);
    }

    Handle<Event> handle() {
        return handle<Event>();
    }

    /**
     * @brief Bind one view to the listed state types
     *
     * A typed view receives std::shared_ptr<const S> when a single type is
     * listed, std::shared_ptr<const State> otherwise.
     */
    template <typename S, typename... More> Render<std::conditional_t<sizeof...(More) == 0, S, State>> render() {
        static_assert(std::is_base_of_v<State, S> && (std::is_base_of_v<State, More> && ...),
                      "rendered types must derive from SFR::State");
        checkMutable();
        return Render<std::conditional_t<sizeof...(More) == 0, S, State>>(
            *this, std::vector<std::type_index>{typeid(S), typeid(More)...});
    }

    template <typename Derived, typename Base> FlowBuilder &declareEvent() {
        checkMutable();
        eventTypes_->template declare<Derived, Base>();
        return *this;
    }

    template <typename Derived, typename Base> FlowBuilder &declareState() {
        checkMutable();
        stateTypes_->template declare<Derived, Base>();
        return *this;
    }

    /**
     * @brief Controller for sessions that have no state yet
     */
    template <typename F> FlowBuilder &initial(F controller) {
        checkMutable();
        initialController_ = Adapters::makeController<Event, State>(std::move(controller));
        return *this;
    }

    template <typename F> FlowBuilder &failView(F view) {
        checkMutable();
        failureView_ = Adapters::makeFailureView<Renderer>(std::move(view));
        return *this;
    }

    FlowBuilder &rendererFactory(RendererFactory<Renderer> factory) {
        checkMutable();
        rendererFactory_ = std::move(factory);
        return *this;
    }

    FlowBuilder &eventSource(std::shared_ptr<IEventSource> source) {
        checkMutable();
        eventSource_ = std::move(source);
        return *this;
    }

    FlowBuilder &executor(std::shared_ptr<IExecutor> executor) {
        checkMutable();
        executor_ = std::move(executor);
        return *this;
    }

    FlowBuilder &sessionStorage(std::shared_ptr<ISessionStorage> storage) {
        checkMutable();
        sessionStorage_ = std::move(storage);
        return *this;
    }

    FlowBuilder &allowUnlockedRendering(bool allow) {
        checkMutable();
        allowUnlockedRendering_ = allow;
        return *this;
    }

    FlowBuilder &observer(std::shared_ptr<IFlowObserver> observer) {
        checkMutable();
        if (!observer) {
            throw FlowConfigurationError("Cannot register a null flow observer");
        }
        observers_.push_back(std::move(observer));
        return *this;
    }

    /**
     * @brief Apply FlowOptions; explicit setters called afterwards take precedence
     */
    FlowBuilder &options(const FlowOptions &options) {
        checkMutable();
        allowUnlockedRendering_ = options.allowUnlockedRendering;
        options_ = options;
        return *this;
    }

    /**
     * @brief Logger backend installed process-wide when the flow is built
     */
    FlowBuilder &logger(std::unique_ptr<ILoggerBackend> backend) {
        checkMutable();
        loggerBackend_ = std::move(backend);
        return *this;
    }

    /**
     * @brief Validate and freeze the configuration
     * @param initialized Subscribe to the event source right away
     * @throws FlowConfigurationError if a required collaborator is missing
     */
    std::shared_ptr<Flow<Renderer>> build(bool initialized = true) {
        checkMutable();

        if (loggerBackend_) {
            Logger::setBackend(std::move(loggerBackend_));
        }
        if (options_) {
            options_->applyLogging();
        }

        FlowConfig<Renderer> config;
        config.eventSource = eventSource_;
        config.rendererFactory = rendererFactory_;
        config.initialController = initialController_;
        config.failureView = failureView_;
        config.controllers = controllers_;
        config.views = views_;
        config.observers = observers_;
        config.allowUnlockedRendering = allowUnlockedRendering_;

        // Placeholders so validate() reports only what the caller left out
        config.executor = executor_ ? executor_ : std::make_shared<InlineExecutor>();
        config.sessionStorage = sessionStorage_ ? sessionStorage_ : std::make_shared<InMemorySessionStorage>();
        config.validate();

        if (!executor_ && options_ && options_->workerThreads > 0) {
            config.executor = std::make_shared<ThreadPoolExecutor>(options_->workerThreads);
        }
        if (!sessionStorage_) {
            config.sessionStorage = std::make_shared<InMemorySessionStorage>(config.executor);
        }

        auto flow = std::make_shared<Flow<Renderer>>(std::move(config));
        built_ = true;

        LOG_INFO("FlowBuilder: Built flow with {} controller bindings, {} views, unlocked rendering {}",
                 controllers_->size(), views_->size(), allowUnlockedRendering_ ? "allowed" : "disallowed");

        if (initialized) {
            flow->init();
        }
        return flow;
    }

private:
    void checkMutable() const {
        if (built_) {
            throw FlowConfigurationError("FlowBuilder cannot be modified after build()");
        }
    }

    std::shared_ptr<TypeHierarchy> eventTypes_;
    std::shared_ptr<TypeHierarchy> stateTypes_;
    std::shared_ptr<ControllerRegistry> controllers_;
    std::shared_ptr<ViewRegistry<Renderer>> views_;

    Controller initialController_;
    FailureView<Renderer> failureView_;
    RendererFactory<Renderer> rendererFactory_;
    std::shared_ptr<IEventSource> eventSource_;
    std::shared_ptr<IExecutor> executor_;
    std::shared_ptr<ISessionStorage> sessionStorage_;
    std::vector<std::shared_ptr<IFlowObserver>> observers_;
    std::optional<FlowOptions> options_;
    std::unique_ptr<ILoggerBackend> loggerBackend_;
    bool allowUnlockedRendering_ = false;
    bool built_ = false;
};

}  // namespace SFR
