#pragma once

#include <scenelink/core/context.h>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace scenelink::runtime {

// Engine integration state as seen by the host.
enum class EngineState {
    NoEngine = 0, // nothing resolved yet
    Running,      // engine alive, bound to snapshot.context
    Disabled,     // disabled indicator shown; an engine may still be retained
    Stopped,      // host exited or shutdown() was called
};

constexpr const char* engineStateName(EngineState s) {
    switch (s) {
        case EngineState::NoEngine: return "no_engine";
        case EngineState::Running: return "running";
        case EngineState::Disabled: return "disabled";
        case EngineState::Stopped: return "stopped";
    }
    return "unknown";
}

struct EngineLifecycleSnapshot {
    EngineState state{EngineState::NoEngine};
    std::optional<Context> context; // context of the live engine, if any
    bool engineRetained{false};     // Disabled while an engine is still alive
    std::string lastError;          // empty when no error
    std::uint64_t transitions{0};
    std::chrono::steady_clock::time_point lastTransition{};
};

// Events that can be dispatched to the FSM
struct EngineStartedEvent {
    Context context;
};
struct ContextKeptEvent {};
struct EngineDisabledEvent {
    std::string reason;
    bool engineRetained{false};
};
struct EngineStoppedEvent {};

class EngineLifecycleFsm {
public:
    EngineLifecycleSnapshot snapshot() const {
        MutexLock lock(mutex_);
        return snapshot_;
    }

    EngineState state() const { return snapshot().state; }

    void dispatch(const EngineStartedEvent& ev);
    void dispatch(const ContextKeptEvent& ev);
    void dispatch(const EngineDisabledEvent& ev);
    void dispatch(const EngineStoppedEvent& ev);

private:
    using MutexLock = std::scoped_lock<std::mutex>;

    void transitionTo(EngineState next, std::optional<std::string> err = std::nullopt);

    EngineLifecycleSnapshot snapshot_{};
    mutable std::mutex mutex_;
};

} // namespace scenelink::runtime
