#pragma once

#include <scenelink/core/context.h>
#include <scenelink/core/types.h>

#include <optional>
#include <string>

namespace scenelink::workspace {

/**
 * @brief Maps document paths onto workspaces and contexts.
 */
class IWorkspaceProvider {
public:
    virtual ~IWorkspaceProvider() = default;

    /// Workspace containing @p path; ErrorCode::NotFound when the path is outside every
    /// known project.
    virtual Result<Workspace> workspaceFromPath(const std::string& path) const = 0;

    /// Context for @p path inside @p ws. @p hint (usually the previous context) is only
    /// consulted when several contexts are plausible for the same path.
    virtual Result<Context> contextFromPath(const Workspace& ws, const std::string& path,
                                            const std::optional<Context>& hint) const = 0;
};

} // namespace scenelink::workspace
