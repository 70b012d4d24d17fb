#include <scenelink/engine/Engine.h>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace scenelink::engine {

Engine::Engine(std::string instanceName, Workspace workspace, Context context,
               EngineSettings settings)
    : instanceName_(std::move(instanceName)),
      workspace_(std::move(workspace)),
      context_(std::move(context)),
      settings_(std::move(settings)) {}

Engine::~Engine() = default;

Result<void> Engine::destroy() {
    if (destroyed_) {
        return {};
    }
    destroyed_ = true;
    logDebug(instanceName_ + ": Destroying...");
    if (!queue_.empty()) {
        spdlog::warn("[Engine] {} discarding {} queued jobs", instanceName_, queue_.size());
    }
    try {
        auto r = destroyEngine();
        if (!r) {
            return Error{ErrorCode::EngineDestroyFailed, r.error().message};
        }
    } catch (const std::exception& e) {
        return Error{ErrorCode::EngineDestroyFailed, e.what()};
    } catch (...) {
        return Error{ErrorCode::EngineDestroyFailed, "unknown exception during teardown"};
    }
    return {};
}

void Engine::logDebug(std::string_view msg) const {
    if (settings_.debugLogging) {
        spdlog::debug("{} DEBUG: {}", instanceName_, msg);
    }
}

} // namespace scenelink::engine
