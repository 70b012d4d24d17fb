#include <scenelink/workspace/DirectoryWorkspaceProvider.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace scenelink::workspace {

namespace {

std::vector<std::string> components(const std::filesystem::path& p) {
    std::vector<std::string> out;
    for (const auto& part : p.lexically_normal()) {
        auto s = part.generic_string();
        if (s.empty() || s == ".")
            continue;
        out.push_back(std::move(s));
    }
    return out;
}

bool isPrefix(const std::vector<std::string>& prefix, const std::vector<std::string>& full) {
    if (prefix.size() > full.size())
        return false;
    return std::equal(prefix.begin(), prefix.end(), full.begin());
}

struct Candidate {
    const EntityScope* scope;
    std::size_t depth;
};

} // namespace

DirectoryWorkspaceProvider::DirectoryWorkspaceProvider(std::vector<Workspace> workspaces)
    : workspaces_(std::move(workspaces)) {}

void DirectoryWorkspaceProvider::addWorkspace(Workspace ws) {
    workspaces_.push_back(std::move(ws));
}

Result<Workspace> DirectoryWorkspaceProvider::workspaceFromPath(const std::string& path) const {
    if (path.empty()) {
        return Error{ErrorCode::InvalidArgument, "empty document path"};
    }
    const auto pathParts = components(path);

    const Workspace* best = nullptr;
    std::size_t bestDepth = 0;
    for (const auto& ws : workspaces_) {
        const auto rootParts = components(ws.root);
        if (rootParts.empty() || !isPrefix(rootParts, pathParts))
            continue;
        if (!best || rootParts.size() > bestDepth) {
            best = &ws;
            bestDepth = rootParts.size();
        }
    }

    if (!best) {
        return Error{ErrorCode::NotFound,
                     "'" + path + "' is not located inside any known project"};
    }
    return *best;
}

Result<Context> DirectoryWorkspaceProvider::contextFromPath(
    const Workspace& ws, const std::string& path, const std::optional<Context>& hint) const {
    const auto rootParts = components(ws.root);
    const auto pathParts = components(path);
    if (rootParts.empty() || !isPrefix(rootParts, pathParts)) {
        return Error{ErrorCode::InvalidArgument,
                     "'" + path + "' is not inside workspace '" + ws.name + "'"};
    }
    const std::vector<std::string> rel(pathParts.begin() + rootParts.size(), pathParts.end());

    Context ctx;
    ctx.project = ws.name;

    std::vector<Candidate> candidates;
    for (const auto& scope : ws.entities) {
        const auto scopeParts = components(scope.relativeDir);
        if (scopeParts.empty() || !isPrefix(scopeParts, rel))
            continue;
        candidates.push_back(Candidate{&scope, scopeParts.size()});
    }
    if (candidates.empty()) {
        return ctx;
    }

    const Candidate* chosen = nullptr;
    if (candidates.size() > 1 && hint && hint->project == ws.name) {
        for (const auto& c : candidates) {
            if (c.scope->entityType == hint->entityType &&
                components(c.scope->relativeDir).back() == hint->entityName) {
                chosen = &c;
                break;
            }
        }
        if (chosen) {
            spdlog::debug("[DirectoryWorkspaceProvider] Ambiguous path '{}'; keeping {} {}",
                          path, hint->entityType, hint->entityName);
        }
    }
    if (!chosen) {
        chosen = &*std::max_element(
            candidates.begin(), candidates.end(),
            [](const Candidate& a, const Candidate& b) { return a.depth < b.depth; });
    }

    const auto scopeParts = components(chosen->scope->relativeDir);
    ctx.entityType = chosen->scope->entityType;
    ctx.entityName = scopeParts.back();

    // task folder directly below the entity directory
    if (chosen->depth + 1 < rel.size()) {
        const auto& folder = rel[chosen->depth];
        if (std::find(ws.tasks.begin(), ws.tasks.end(), folder) != ws.tasks.end()) {
            ctx.task = folder;
        }
    }
    return ctx;
}

} // namespace scenelink::workspace
