#pragma once

#include <scenelink/workspace/WorkspaceProvider.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace scenelink::workspace {

/**
 * @brief Workspace provider backed by configured project roots.
 *
 * A path belongs to the workspace whose root is its longest component-wise prefix.
 * Inside a workspace every entity scope whose directory prefixes the path is a candidate;
 * nested scopes make a path ambiguous, in which case the hint's entity wins when it is a
 * candidate and the deepest scope wins otherwise. The task is the first path component
 * below the entity directory when it names a configured task.
 */
class DirectoryWorkspaceProvider : public IWorkspaceProvider {
public:
    DirectoryWorkspaceProvider() = default;
    explicit DirectoryWorkspaceProvider(std::vector<Workspace> workspaces);

    void addWorkspace(Workspace ws);
    const std::vector<Workspace>& workspaces() const noexcept { return workspaces_; }

    Result<Workspace> workspaceFromPath(const std::string& path) const override;
    Result<Context> contextFromPath(const Workspace& ws, const std::string& path,
                                    const std::optional<Context>& hint) const override;

private:
    std::vector<Workspace> workspaces_;
};

} // namespace scenelink::workspace
