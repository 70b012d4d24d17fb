#pragma once

#include <scenelink/engine/Engine.h>

#include <memory>
#include <string>
#include <utility>

namespace scenelink::engine {

// What the engine needs to know about the embedding application.
struct HostInfo {
    std::string platform; // e.g. "linux64", "win64", "mac"
    std::string version;
    bool hasUi{true};
};

/**
 * @brief Reference engine: validates platform, host version and context on init.
 */
class BasicEngine : public Engine {
public:
    BasicEngine(std::string instanceName, Workspace workspace, Context context,
                EngineSettings settings, HostInfo hostInfo);

    Result<void> initEngine() override;
    void postInit() override;

    const HostInfo& hostInfo() const noexcept { return hostInfo_; }
    bool isInitialized() const noexcept { return initialized_; }

protected:
    Result<void> destroyEngine() override;

private:
    HostInfo hostInfo_;
    bool initialized_{false};
};

class BasicEngineFactory : public IEngineFactory {
public:
    BasicEngineFactory(EngineSettings settings, HostInfo hostInfo)
        : settings_(std::move(settings)), hostInfo_(std::move(hostInfo)) {}

    Result<std::unique_ptr<Engine>> startEngine(const std::string& name,
                                                const Workspace& workspace,
                                                const Context& context) override;

private:
    EngineSettings settings_;
    HostInfo hostInfo_;
};

} // namespace scenelink::engine
