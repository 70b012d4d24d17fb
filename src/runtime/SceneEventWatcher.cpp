#include <scenelink/runtime/SceneEventWatcher.h>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace scenelink::runtime {

using host::HostEvent;
using host::SubscriptionId;

SceneEventWatcher::SceneEventWatcher(host::IHostDocumentApi& host) : host_(host) {}

SceneEventWatcher::~SceneEventWatcher() {
    stop();
}

const std::vector<HostEvent>& SceneEventWatcher::defaultEvents() {
    static const std::vector<HostEvent> kEvents{HostEvent::DocumentOpened,
                                                HostEvent::DocumentSaved,
                                                HostEvent::DocumentCreated};
    return kEvents;
}

Result<void> SceneEventWatcher::start(const std::vector<HostEvent>& events, bool runOnce,
                                      Callback callback, Callback exitCallback) {
    // if currently watching then stop
    stop();

    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = ++generation_;
        watching_ = true;
        runOnce_ = runOnce;
        callback_ = std::move(callback);
        exitCallback_ = std::move(exitCallback);
    }

    std::vector<SubscriptionId> ids;
    ids.reserve(events.size() + 1);
    for (auto ev : events) {
        if (ev == HostEvent::HostExiting) {
            continue; // always registered below
        }
        try {
            auto r = host_.subscribe(ev, [this, generation, ev]() { onSceneEvent(generation, ev); });
            if (!r) {
                spdlog::warn("[SceneEventWatcher] Could not subscribe to {}: {}",
                             host::hostEventName(ev), r.error().message);
                continue;
            }
            ids.push_back(r.value());
        } catch (const std::exception& e) {
            spdlog::warn("[SceneEventWatcher] Could not subscribe to {}: {}",
                         host::hostEventName(ev), e.what());
        } catch (...) {
            spdlog::warn("[SceneEventWatcher] Could not subscribe to {}: unknown exception",
                         host::hostEventName(ev));
        }
    }

    // clean-up hook for when the host exits
    Result<void> result;
    try {
        auto r = host_.subscribe(HostEvent::HostExiting,
                                 [this, generation]() { onHostExiting(generation); });
        if (r) {
            ids.push_back(r.value());
        } else {
            result = Error{ErrorCode::SubscriptionFailed,
                           "host_exiting subscription failed: " + r.error().message};
        }
    } catch (const std::exception& e) {
        result = Error{ErrorCode::SubscriptionFailed,
                       std::string("host_exiting subscription failed: ") + e.what()};
    } catch (...) {
        result = Error{ErrorCode::SubscriptionFailed,
                       "host_exiting subscription failed: unknown exception"};
    }
    if (!result) {
        spdlog::error("[SceneEventWatcher] {}", result.error().message);
    }

    bool superseded = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation_ == generation) {
            subscriptions_.insert(subscriptions_.end(), ids.begin(), ids.end());
        } else {
            superseded = true;
        }
    }
    if (superseded) {
        // stopped (or restarted) while we were subscribing
        for (auto id : ids) {
            try {
                host_.unsubscribe(id);
            } catch (const std::exception& e) {
                spdlog::warn("[SceneEventWatcher] Failed to remove subscription {}: {}", id,
                             e.what());
            } catch (...) {
                spdlog::warn("[SceneEventWatcher] Failed to remove subscription {}", id);
            }
        }
        return result;
    }

    spdlog::debug("[SceneEventWatcher] Watching {} host events (run_once={})", ids.size(),
                  runOnce);
    return result;
}

void SceneEventWatcher::stop() {
    std::vector<SubscriptionId> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!watching_ && subscriptions_.empty()) {
            return;
        }
        ids.swap(subscriptions_);
        watching_ = false;
        ++generation_;
    }

    for (auto id : ids) {
        try {
            host_.unsubscribe(id);
        } catch (const std::exception& e) {
            spdlog::warn("[SceneEventWatcher] Failed to remove subscription {}: {}", id, e.what());
        } catch (...) {
            spdlog::warn("[SceneEventWatcher] Failed to remove subscription {}", id);
        }
    }
    if (!ids.empty()) {
        spdlog::debug("[SceneEventWatcher] Removed {} host subscriptions", ids.size());
    }
}

bool SceneEventWatcher::isWatching() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return watching_;
}

bool SceneEventWatcher::isRunOnce() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runOnce_;
}

std::size_t SceneEventWatcher::activeSubscriptionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

void SceneEventWatcher::onSceneEvent(std::uint64_t generation, HostEvent event) {
    Callback cb;
    bool runOnce = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            spdlog::debug("[SceneEventWatcher] Ignoring stale {} delivery",
                          host::hostEventName(event));
            return;
        }
        cb = callback_;
        runOnce = runOnce_;
    }

    spdlog::debug("[SceneEventWatcher] Host event {}", host::hostEventName(event));
    if (runOnce) {
        stop();
    }
    if (cb) {
        cb();
    }
}

void SceneEventWatcher::onHostExiting(std::uint64_t generation) {
    Callback onExit;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        onExit = exitCallback_;
    }

    spdlog::debug("[SceneEventWatcher] Host exiting; removing callbacks");
    stop();
    if (onExit) {
        onExit();
    }
}

} // namespace scenelink::runtime
