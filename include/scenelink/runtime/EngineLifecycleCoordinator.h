#pragma once

#include <scenelink/engine/Engine.h>
#include <scenelink/host/host_interfaces.h>
#include <scenelink/runtime/ContextResolver.h>
#include <scenelink/runtime/EngineLifecycleFsm.h>
#include <scenelink/runtime/SceneEventWatcher.h>
#include <scenelink/workspace/WorkspaceProvider.h>

#include <memory>
#include <optional>
#include <string>

namespace scenelink::runtime {

// Text for the disabled indicator's "why" dialog.
inline constexpr const char* kDisabledExplanation =
    "SceneLink is disabled because it cannot recognize the currently opened file. "
    "Try opening another file or restarting the host application.";

/**
 * @brief Keeps the single engine instance in step with the host's open document.
 *
 * On start() and on every document event the coordinator resolves the current document
 * into a context and then keeps the engine, rebuilds it (destroy strictly before
 * construct), or falls back to the disabled state.
 *
 * ## Ownership
 * The coordinator is the only owner of the engine slot. Collaborators get read access
 * through currentEngine().
 *
 * ## Failure handling
 * Nothing thrown while handling an event escapes the handler. Unexpected errors are
 * logged and treated like an engine construction failure. After every event the scene
 * watcher is armed again: persistently while an engine is alive, one-shot otherwise.
 *
 * ## Threading
 * Events are expected one at a time on the host's event thread. Events that re-enter the
 * handler while a transition is in progress are coalesced into one more pass after the
 * current transition completes.
 */
class EngineLifecycleCoordinator {
public:
    struct Dependencies {
        host::IHostDocumentApi& host;
        host::IDisabledIndicator& indicator;
        const workspace::IWorkspaceProvider& workspaces;
        engine::IEngineFactory& factory;
    };

    EngineLifecycleCoordinator(Dependencies deps, std::string engineName);
    ~EngineLifecycleCoordinator();

    EngineLifecycleCoordinator(const EngineLifecycleCoordinator&) = delete;
    EngineLifecycleCoordinator& operator=(const EngineLifecycleCoordinator&) = delete;

    /**
     * @brief Resolves the current document once and arms the scene watcher.
     *
     * @return the active engine, or nullptr when none could be started
     */
    engine::Engine* start();

    /// Scene event entry point; returns the engine active afterwards (may be nullptr).
    engine::Engine* onSceneEvent();

    /// Stops watching, destroys any engine and enters Stopped. Idempotent.
    void shutdown();

    engine::Engine* currentEngine() const noexcept { return engine_.get(); }
    std::optional<Context> currentContext() const { return context_; }

    EngineState state() const { return fsm_.state(); }
    EngineLifecycleSnapshot snapshot() const { return fsm_.snapshot(); }

    bool isDisabledIndicatorShown() const noexcept { return indicatorShown_; }
    bool isWatching() const { return watcher_.isWatching(); }
    bool hostExited() const noexcept { return hostExited_; }
    const SceneEventWatcher& watcher() const noexcept { return watcher_; }

private:
    void handleEvent();
    void refreshEngine(const std::string& path);
    void destroyCurrentEngine();
    void enterDisabled(const std::string& reason, const std::string& userMessage);
    void showIndicator();
    void clearIndicator();
    void rearmWatcher();
    void onHostExiting();

    Dependencies deps_;
    std::string engineName_;
    ContextResolver resolver_;
    EngineLifecycleFsm fsm_;

    std::unique_ptr<engine::Engine> engine_;
    std::optional<Context> context_; // context the live engine was started for

    bool indicatorShown_{false};
    bool handling_{false};
    bool refreshPending_{false};
    bool hostExited_{false};
    bool stopped_{false};

    // declared last so it is torn down first; its callbacks capture this
    SceneEventWatcher watcher_;
};

} // namespace scenelink::runtime
