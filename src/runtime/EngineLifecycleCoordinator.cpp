#include <scenelink/runtime/EngineLifecycleCoordinator.h>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace scenelink::runtime {

EngineLifecycleCoordinator::EngineLifecycleCoordinator(Dependencies deps, std::string engineName)
    : deps_(deps),
      engineName_(std::move(engineName)),
      resolver_(deps.workspaces),
      watcher_(deps.host) {}

EngineLifecycleCoordinator::~EngineLifecycleCoordinator() {
    shutdown();
}

engine::Engine* EngineLifecycleCoordinator::start() {
    if (stopped_ || hostExited_) {
        spdlog::warn("[EngineLifecycleCoordinator] start() ignored: coordinator is stopped");
        return nullptr;
    }
    spdlog::debug("[EngineLifecycleCoordinator] Starting '{}'", engineName_);
    return onSceneEvent();
}

engine::Engine* EngineLifecycleCoordinator::onSceneEvent() {
    if (stopped_ || hostExited_) {
        return engine_.get();
    }
    if (handling_) {
        // an engine (re)build made the host emit another event; run again once we are done
        refreshPending_ = true;
        spdlog::debug("[EngineLifecycleCoordinator] Scene event during transition; deferring");
        return engine_.get();
    }

    {
        // RAII guard to clear the flag when we leave this scope.
        struct HandlingGuard {
            bool& flag;
            ~HandlingGuard() { flag = false; }
        } handlingGuard{handling_};
        handling_ = true;
        do {
            refreshPending_ = false;
            handleEvent();
        } while (refreshPending_ && !stopped_ && !hostExited_);
    }

    // never leave the integration deaf to future events
    rearmWatcher();
    return engine_.get();
}

void EngineLifecycleCoordinator::handleEvent() {
    std::string path;
    try {
        path = deps_.host.currentDocumentPath();
        refreshEngine(path);
    } catch (const std::exception& e) {
        spdlog::error("[EngineLifecycleCoordinator] There was a problem starting the engine "
                      "(state={}, document='{}'): {}",
                      engineStateName(fsm_.state()), path, e.what());
        enterDisabled(e.what(), std::string("Engine cannot be started: ") + e.what());
    } catch (...) {
        spdlog::error("[EngineLifecycleCoordinator] There was a problem starting the engine "
                      "(state={}, document='{}'): unknown exception",
                      engineStateName(fsm_.state()), path);
        enterDisabled("unknown exception", "Engine cannot be started: unknown error");
    }
}

void EngineLifecycleCoordinator::refreshEngine(const std::string& path) {
    auto outcome = resolver_.resolve(path, context_);
    spdlog::debug("[EngineLifecycleCoordinator] Resolved '{}' -> {}", path,
                  resolveKindName(outcome.kind));

    switch (outcome.kind) {
        case ResolveKind::Unchanged:
            // file->new keeps the current context/engine
            return;

        case ResolveKind::Unresolvable:
            // a running engine is left alive; only the disabled indicator is shown
            enterDisabled(outcome.reason, "Engine cannot be started: " + outcome.reason);
            return;

        case ResolveKind::Same:
            if (engine_) {
                clearIndicator();
                fsm_.dispatch(ContextKeptEvent{});
                return;
            }
            break; // nothing alive to keep; build one below

        case ResolveKind::Changed:
            break;
    }

    if (engine_) {
        engine_->logDebug("Ready to switch to context because of scene event!");
        engine_->logDebug("Prev context: " + (context_ ? context_->toString() : "<none>"));
        engine_->logDebug("New context: " + outcome.context->toString());
        // teardown must complete before the replacement is constructed
        destroyCurrentEngine();
    }

    auto started = deps_.factory.startEngine(engineName_, *outcome.workspace, *outcome.context);
    if (!started || !started.value()) {
        const std::string reason =
            started ? std::string("engine factory returned no engine") : started.error().message;
        spdlog::warn("[EngineLifecycleCoordinator] Engine cannot be started: {}", reason);
        enterDisabled(reason, "Engine cannot be started: " + reason);
        return;
    }

    engine_ = std::move(started).value();
    context_ = outcome.context;
    engine_->logDebug("Launched new engine for context!");
    clearIndicator();
    fsm_.dispatch(EngineStartedEvent{*context_});
}

void EngineLifecycleCoordinator::destroyCurrentEngine() {
    auto old = std::move(engine_);
    context_.reset();
    if (!old) {
        return;
    }
    // destroy failures are recovered: the slot is released and callers carry on
    try {
        auto r = old->destroy();
        if (!r) {
            spdlog::error("[EngineLifecycleCoordinator] Engine '{}' failed to destroy cleanly: {}",
                          old->instanceName(), r.error().message);
        }
    } catch (const std::exception& e) {
        spdlog::error("[EngineLifecycleCoordinator] Engine '{}' threw during destroy: {}",
                      old->instanceName(), e.what());
    } catch (...) {
        spdlog::error("[EngineLifecycleCoordinator] Engine '{}' threw during destroy",
                      old->instanceName());
    }
}

void EngineLifecycleCoordinator::enterDisabled(const std::string& reason,
                                               const std::string& userMessage) {
    try {
        deps_.indicator.showInfoMessage(userMessage);
    } catch (const std::exception& e) {
        spdlog::warn("[EngineLifecycleCoordinator] Could not show message: {}", e.what());
    } catch (...) {
        spdlog::warn("[EngineLifecycleCoordinator] Could not show message: unknown exception");
    }
    showIndicator();
    fsm_.dispatch(EngineDisabledEvent{reason, engine_ != nullptr});
}

void EngineLifecycleCoordinator::showIndicator() {
    if (indicatorShown_) {
        return;
    }
    try {
        deps_.indicator.showDisabledIndicator();
    } catch (const std::exception& e) {
        spdlog::warn("[EngineLifecycleCoordinator] Could not show disabled indicator: {}",
                     e.what());
    } catch (...) {
        spdlog::warn("[EngineLifecycleCoordinator] Could not show disabled indicator: unknown "
                     "exception");
    }
    indicatorShown_ = true;
}

void EngineLifecycleCoordinator::clearIndicator() {
    if (!indicatorShown_) {
        return;
    }
    try {
        deps_.indicator.clearDisabledIndicator();
    } catch (const std::exception& e) {
        spdlog::warn("[EngineLifecycleCoordinator] Could not clear disabled indicator: {}",
                     e.what());
    } catch (...) {
        spdlog::warn("[EngineLifecycleCoordinator] Could not clear disabled indicator: unknown "
                     "exception");
    }
    indicatorShown_ = false;
}

void EngineLifecycleCoordinator::rearmWatcher() {
    if (stopped_ || hostExited_) {
        return;
    }
    // persistent while an engine lives; otherwise retry on the next event only
    const bool runOnce = (engine_ == nullptr);
    if (watcher_.isWatching() && watcher_.isRunOnce() == runOnce) {
        return;
    }
    try {
        auto r = watcher_.start(
            SceneEventWatcher::defaultEvents(), runOnce, [this]() { onSceneEvent(); },
            [this]() { onHostExiting(); });
        if (!r) {
            spdlog::warn("[EngineLifecycleCoordinator] Scene watcher armed without exit hook: {}",
                         r.error().message);
        }
    } catch (const std::exception& e) {
        spdlog::error("[EngineLifecycleCoordinator] Failed to arm scene watcher: {}", e.what());
        return;
    } catch (...) {
        spdlog::error("[EngineLifecycleCoordinator] Failed to arm scene watcher: unknown exception");
        return;
    }
    spdlog::debug("[EngineLifecycleCoordinator] Scene watcher armed (run_once={})", runOnce);
}

void EngineLifecycleCoordinator::onHostExiting() {
    // the watcher has already removed its callbacks
    hostExited_ = true;
    spdlog::info("[EngineLifecycleCoordinator] Host exiting; scene events no longer watched");
}

void EngineLifecycleCoordinator::shutdown() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    watcher_.stop();
    if (engine_) {
        engine_->logDebug("Shutting down engine");
        destroyCurrentEngine();
    }
    clearIndicator();
    fsm_.dispatch(EngineStoppedEvent{});
}

} // namespace scenelink::runtime
