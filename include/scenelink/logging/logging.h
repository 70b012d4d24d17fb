#pragma once

#include <scenelink/config/ShimConfig.h>
#include <scenelink/core/types.h>
#include <scenelink/host/host_interfaces.h>

#include <spdlog/common.h>

#include <string>

namespace scenelink::logging {

// "trace" .. "error"/"critical"/"off"; unknown names map to info.
spdlog::level::level_enum parseLevel(const std::string& name);

/**
 * @brief Install the "scenelink" default logger.
 *
 * Sinks: the host console (when @p console is given) and a rotating file (when
 * logging.file is set). debug_logging forces the level to debug.
 */
Result<void> configureLogging(const config::ShimConfig& cfg, host::IHostConsole* console);

} // namespace scenelink::logging
