#pragma once

#include "common/FlowErrors.h"
#include "events/IEventSource.h"
#include "runtime/ControllerRegistry.h"
#include "runtime/IExecutor.h"
#include "runtime/IFlowObserver.h"
#include "runtime/ViewRegistry.h"
#include "storage/ISessionStorage.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace SFR {

/**
 * @brief Creates the renderer that scopes output to one event (e.g. a reply channel)
 *
 * Called once per event (and once more if a failure has to be rendered);
 * must not block.
 */
template <typename Renderer> using RendererFactory = std::function<Renderer(const EventPtr &)>;

/**
 * @brief Everything a Flow needs, assembled before the first event
 *
 * Normally produced by FlowBuilder; can be filled in directly when the
 * registries are built elsewhere.
 */
template <typename Renderer> struct FlowConfig {
    std::shared_ptr<IEventSource> eventSource;
    std::shared_ptr<ISessionStorage> sessionStorage;
    std::shared_ptr<IExecutor> executor;
    RendererFactory<Renderer> rendererFactory;
    Controller initialController;
    FailureView<Renderer> failureView;
    std::shared_ptr<const ControllerRegistry> controllers;
    std::shared_ptr<const ViewRegistry<Renderer>> views;
    std::vector<std::shared_ptr<IFlowObserver>> observers;
    bool allowUnlockedRendering = false;

    /**
     * @throws FlowConfigurationError naming every missing collaborator
     */
    void validate() const {
        std::vector<std::string> missing;
        if (!rendererFactory) {
            missing.emplace_back("renderer factory");
        }
        if (!eventSource) {
            missing.emplace_back("event source");
        }
        if (!initialController) {
            missing.emplace_back("initial controller");
        }
        if (!failureView) {
            missing.emplace_back("failure view");
        }
        if (!sessionStorage) {
            missing.emplace_back("session storage");
        }
        if (!executor) {
            missing.emplace_back("executor");
        }
        if (!controllers) {
            missing.emplace_back("controller registry");
        }
        if (!views) {
            missing.emplace_back("view registry");
        }

        if (!missing.empty()) {
            std::string message = "Flow configuration is incomplete, missing: ";
            for (size_t i = 0; i < missing.size(); ++i) {
                message += (i > 0 ? ", " : "") + missing[i];
            }
            throw FlowConfigurationError(message);
        }
    }
};

}  // namespace SFR
