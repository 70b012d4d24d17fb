#pragma once

#include <scenelink/core/types.h>
#include <scenelink/host/host_interfaces.h>

#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

namespace scenelink::runtime {

/**
 * @brief Routes a set of host lifecycle events into a single callback.
 *
 * Each start() opens a new registration generation; every host handler captures the
 * generation it was registered under and ignores deliveries once that generation has been
 * stopped. This makes it safe for the host to deliver an in-flight event after unsubscribe,
 * and for a callback to stop or restart the watcher that invoked it.
 *
 * ## Run-once
 * With `runOnce` the watcher stops itself before the callback runs, so a callback that
 * arms a fresh watcher never races the cleanup of the old registrations.
 *
 * ## Host exit
 * The host-exiting event is always subscribed. When it fires the watcher stops and then
 * calls the optional exit callback.
 */
class SceneEventWatcher {
public:
    using Callback = std::function<void()>;

    explicit SceneEventWatcher(host::IHostDocumentApi& host);
    ~SceneEventWatcher();

    SceneEventWatcher(const SceneEventWatcher&) = delete;
    SceneEventWatcher& operator=(const SceneEventWatcher&) = delete;

    /// Document opened, saved and created.
    static const std::vector<host::HostEvent>& defaultEvents();

    /**
     * @brief Replaces any existing registrations and subscribes to @p events.
     *
     * A failure to subscribe one event kind is logged and skipped.
     *
     * @return error only when the host-exiting subscription could not be made; the
     *         remaining subscriptions stay active in that case
     */
    Result<void> start(const std::vector<host::HostEvent>& events, bool runOnce,
                       Callback callback, Callback exitCallback = {});

    /**
     * @brief Releases all registrations.
     *
     * Idempotent, and safe to call concurrently or from inside a watcher callback.
     */
    void stop();

    bool isWatching() const;
    bool isRunOnce() const;
    std::size_t activeSubscriptionCount() const;

private:
    void onSceneEvent(std::uint64_t generation, host::HostEvent event);
    void onHostExiting(std::uint64_t generation);

    host::IHostDocumentApi& host_;

    mutable std::mutex mutex_;
    std::vector<host::SubscriptionId> subscriptions_;
    std::uint64_t generation_{0};
    bool watching_{false};
    bool runOnce_{false};
    Callback callback_;
    Callback exitCallback_;
};

} // namespace scenelink::runtime
