#pragma once

#include <scenelink/core/context.h>
#include <scenelink/core/types.h>
#include <scenelink/engine/Engine.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace scenelink::config {

struct LoggingSettings {
    std::string level{"info"};
    std::filesystem::path file; // empty: host console only
    std::size_t consoleWidth{200};
};

struct ShimConfig {
    engine::EngineSettings engine;
    LoggingSettings logging;
    std::vector<Workspace> workspaces;
    std::filesystem::path sourcePath; // empty when defaults were used
};

/**
 * @brief Build a ShimConfig from a flat "section.key" map.
 *
 * Recognised sections: [engine], [logging], [workspace.<name>] and
 * [workspace.<name>.entities]. Unknown keys are ignored.
 */
Result<ShimConfig> shimConfigFromMap(const std::map<std::string, std::string>& flat);

/**
 * @brief Load configuration from @p path, or from the default location when empty.
 *
 * A missing file yields defaults. SCENELINK_DEBUG_LOGGING and SCENELINK_LOG_LEVEL override
 * the file.
 */
Result<ShimConfig> loadShimConfig(const std::filesystem::path& path = {});

void applyEnvironmentOverrides(ShimConfig& cfg);

} // namespace scenelink::config
