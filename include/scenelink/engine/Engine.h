#pragma once

#include <scenelink/core/context.h>
#include <scenelink/core/types.h>
#include <scenelink/jobs/JobQueue.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace scenelink::engine {

struct EngineSettings {
    std::string name{"tk-host"};
    bool debugLogging{false};
    // Empty lists accept anything. Versions match by prefix ("2024" accepts "2024.2").
    std::vector<std::string> supportedHostVersions;
    std::vector<std::string> supportedPlatforms;
};

/**
 * @brief Running integration instance bound to exactly one context.
 *
 * Instances are created through an IEngineFactory and owned by the lifecycle coordinator.
 * destroy() runs the subclass teardown once; later calls are no-ops. Teardown failures,
 * thrown or returned, come back as ErrorCode::EngineDestroyFailed.
 */
class Engine {
public:
    Engine(std::string instanceName, Workspace workspace, Context context,
           EngineSettings settings);
    virtual ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    const std::string& instanceName() const noexcept { return instanceName_; }
    const Workspace& workspace() const noexcept { return workspace_; }
    const Context& context() const noexcept { return context_; }
    const EngineSettings& settings() const noexcept { return settings_; }

    // Legacy serial job queue owned by this engine.
    jobs::JobQueue& jobQueue() noexcept { return queue_; }

    virtual Result<void> initEngine() { return {}; }
    virtual void postInit() {}

    Result<void> destroy();
    bool isDestroyed() const noexcept { return destroyed_; }

    // Emitted only when the engine's debug_logging setting is on.
    void logDebug(std::string_view msg) const;

protected:
    virtual Result<void> destroyEngine() { return {}; }

private:
    std::string instanceName_;
    Workspace workspace_;
    Context context_;
    EngineSettings settings_;
    jobs::JobQueue queue_;
    bool destroyed_{false};
};

class IEngineFactory {
public:
    virtual ~IEngineFactory() = default;

    /// Constructs and initializes an engine; ErrorCode::EngineInitFailed on failure.
    virtual Result<std::unique_ptr<Engine>> startEngine(const std::string& name,
                                                        const Workspace& workspace,
                                                        const Context& context) = 0;
};

} // namespace scenelink::engine
