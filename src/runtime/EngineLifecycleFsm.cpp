#include <scenelink/runtime/EngineLifecycleFsm.h>

#include <spdlog/spdlog.h>

namespace scenelink::runtime {

void EngineLifecycleFsm::transitionTo(EngineState next, std::optional<std::string> err) {
    // caller holds mutex_
    auto prev = snapshot_.state;
    snapshot_.lastError = err.value_or("");
    if (prev == next) {
        spdlog::debug("[EngineLifecycleFsm] Transition no-op: already {}", engineStateName(next));
        return;
    }
    snapshot_.state = next;
    snapshot_.lastTransition = std::chrono::steady_clock::now();
    ++snapshot_.transitions;
    spdlog::info("[EngineLifecycleFsm] {} -> {}{}", engineStateName(prev), engineStateName(next),
                 snapshot_.lastError.empty() ? ""
                                             : (std::string{" error="} + snapshot_.lastError));
}

void EngineLifecycleFsm::dispatch(const EngineStartedEvent& ev) {
    MutexLock lock(mutex_);
    if (snapshot_.state == EngineState::Stopped) {
        return;
    }
    snapshot_.context = ev.context;
    snapshot_.engineRetained = false;
    transitionTo(EngineState::Running);
}

void EngineLifecycleFsm::dispatch(const ContextKeptEvent&) {
    MutexLock lock(mutex_);
    switch (snapshot_.state) {
        case EngineState::Running:
            break;
        case EngineState::Disabled:
            // only an engine that survived the disable can be resumed
            if (snapshot_.engineRetained) {
                snapshot_.engineRetained = false;
                transitionTo(EngineState::Running);
            }
            break;
        default:
            break;
    }
}

void EngineLifecycleFsm::dispatch(const EngineDisabledEvent& ev) {
    MutexLock lock(mutex_);
    switch (snapshot_.state) {
        case EngineState::NoEngine:
        case EngineState::Running:
        case EngineState::Disabled:
            snapshot_.engineRetained = ev.engineRetained;
            if (!ev.engineRetained) {
                snapshot_.context.reset();
            }
            transitionTo(EngineState::Disabled, ev.reason);
            break;
        default:
            break;
    }
}

void EngineLifecycleFsm::dispatch(const EngineStoppedEvent&) {
    MutexLock lock(mutex_);
    snapshot_.context.reset();
    snapshot_.engineRetained = false;
    transitionTo(EngineState::Stopped);
}

} // namespace scenelink::runtime
