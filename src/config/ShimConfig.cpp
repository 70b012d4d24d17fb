#include <scenelink/config/ShimConfig.h>
#include <scenelink/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <exception>
#include <string_view>
#include <system_error>

namespace scenelink::config {

namespace {

constexpr std::string_view kWorkspacePrefix = "workspace.";
constexpr std::string_view kEntitiesKey = "entities.";

Workspace& workspaceNamed(std::map<std::string, Workspace>& byName, const std::string& name) {
    auto& ws = byName[name];
    ws.name = name;
    return ws;
}

} // namespace

Result<ShimConfig> shimConfigFromMap(const std::map<std::string, std::string>& flat) {
    ShimConfig cfg;
    std::map<std::string, Workspace> byName;

    for (const auto& [key, value] : flat) {
        if (key == "engine.name") {
            if (!value.empty())
                cfg.engine.name = value;
        } else if (key == "engine.debug_logging") {
            cfg.engine.debugLogging = env_truthy(value.c_str());
        } else if (key == "engine.supported_host_versions") {
            cfg.engine.supportedHostVersions = parse_list(value);
        } else if (key == "engine.supported_platforms") {
            cfg.engine.supportedPlatforms = parse_list(value);
        } else if (key == "logging.level") {
            if (!value.empty())
                cfg.logging.level = value;
        } else if (key == "logging.file") {
            cfg.logging.file = value.empty() ? std::filesystem::path{} : expand_tilde(value);
        } else if (key == "logging.console_width") {
            try {
                cfg.logging.consoleWidth = static_cast<std::size_t>(std::stoul(value));
            } catch (const std::exception&) {
                return Error{ErrorCode::InvalidData,
                             "logging.console_width must be a positive integer, got '" + value +
                                 "'"};
            }
        } else if (key.rfind(kWorkspacePrefix, 0) == 0) {
            const std::string rest = key.substr(kWorkspacePrefix.size());
            const auto dot = rest.find('.');
            if (dot == std::string::npos || dot == 0)
                continue;
            const std::string name = rest.substr(0, dot);
            const std::string field = rest.substr(dot + 1);
            auto& ws = workspaceNamed(byName, name);
            if (field == "root") {
                ws.root = expand_tilde(value);
            } else if (field == "tasks") {
                ws.tasks = parse_list(value);
            } else if (field.rfind(kEntitiesKey, 0) == 0) {
                ws.entities.push_back(
                    EntityScope{std::filesystem::path(field.substr(kEntitiesKey.size())), value});
            }
        }
    }

    for (auto& [name, ws] : byName) {
        if (ws.root.empty()) {
            return Error{ErrorCode::InvalidData, "workspace '" + name + "' has no root"};
        }
        cfg.workspaces.push_back(std::move(ws));
    }
    if (cfg.logging.consoleWidth == 0) {
        return Error{ErrorCode::InvalidData, "logging.console_width must be greater than zero"};
    }
    return cfg;
}

void applyEnvironmentOverrides(ShimConfig& cfg) {
    if (const char* dbg = std::getenv("SCENELINK_DEBUG_LOGGING")) {
        cfg.engine.debugLogging = env_truthy(dbg);
    }
    if (const char* lvl = std::getenv("SCENELINK_LOG_LEVEL"); lvl && *lvl) {
        cfg.logging.level = lvl;
    }
}

Result<ShimConfig> loadShimConfig(const std::filesystem::path& path) {
    const auto resolved = path.empty() ? resolve_default_config_path() : path;

    std::error_code ec;
    if (resolved.empty() || !std::filesystem::exists(resolved, ec)) {
        if (!resolved.empty()) {
            spdlog::warn("[ShimConfig] Config file '{}' not found; using defaults",
                         resolved.string());
        }
        ShimConfig defaults;
        applyEnvironmentOverrides(defaults);
        return defaults;
    }

    auto cfg = shimConfigFromMap(parse_simple_toml_flat(resolved));
    if (!cfg) {
        return Error{cfg.error().code, resolved.string() + ": " + cfg.error().message};
    }
    auto out = std::move(cfg).value();
    out.sourcePath = resolved;
    applyEnvironmentOverrides(out);
    spdlog::debug("[ShimConfig] Loaded {} workspaces from {}", out.workspaces.size(),
                  resolved.string());
    return out;
}

} // namespace scenelink::config
