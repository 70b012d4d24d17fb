#include <scenelink/engine/BasicEngine.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace scenelink::engine {

namespace {

std::string joinList(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty())
            out += ", ";
        out += item;
    }
    return out;
}

} // namespace

BasicEngine::BasicEngine(std::string instanceName, Workspace workspace, Context context,
                         EngineSettings settings, HostInfo hostInfo)
    : Engine(std::move(instanceName), std::move(workspace), std::move(context),
             std::move(settings)),
      hostInfo_(std::move(hostInfo)) {}

Result<void> BasicEngine::initEngine() {
    logDebug(instanceName() + ": Initializing...");

    const auto& platforms = settings().supportedPlatforms;
    if (!platforms.empty() &&
        std::find(platforms.begin(), platforms.end(), hostInfo_.platform) == platforms.end()) {
        return Error{ErrorCode::EngineInitFailed,
                     "The current platform '" + hostInfo_.platform +
                         "' is not supported! Supported platforms are " + joinList(platforms) +
                         "."};
    }

    const auto& versions = settings().supportedHostVersions;
    if (!versions.empty()) {
        const bool supported =
            std::any_of(versions.begin(), versions.end(), [this](const std::string& v) {
                return hostInfo_.version.rfind(v, 0) == 0;
            });
        if (!supported) {
            return Error{ErrorCode::EngineInitFailed,
                         "Host version '" + hostInfo_.version +
                             "' is not supported. Supported versions: " + joinList(versions)};
        }
    }
    logDebug("Running host version " + hostInfo_.version);

    // must have at least a project in the context to even start
    if (context().project.empty()) {
        return Error{ErrorCode::EngineInitFailed,
                     "The engine needs at least a project in the context in order to start! "
                     "Your context: " +
                         context().toString()};
    }

    initialized_ = true;
    return {};
}

void BasicEngine::postInit() {
    if (!hostInfo_.hasUi) {
        logDebug("Batch mode detected; skipping menu setup");
        return;
    }
    logDebug("Engine ready for " + context().toString());
}

Result<void> BasicEngine::destroyEngine() {
    initialized_ = false;
    return {};
}

Result<std::unique_ptr<Engine>> BasicEngineFactory::startEngine(const std::string& name,
                                                                const Workspace& workspace,
                                                                const Context& context) {
    try {
        auto engine =
            std::make_unique<BasicEngine>(name, workspace, context, settings_, hostInfo_);
        auto init = engine->initEngine();
        if (!init) {
            return Error{ErrorCode::EngineInitFailed, init.error().message};
        }
        engine->postInit();
        spdlog::info("[BasicEngineFactory] Started engine '{}' for {}", name,
                     context.toString());
        return std::unique_ptr<Engine>(std::move(engine));
    } catch (const std::exception& e) {
        return Error{ErrorCode::EngineInitFailed, e.what()};
    }
}

} // namespace scenelink::engine
