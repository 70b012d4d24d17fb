#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace scenelink {

// Identifies the unit of work (project / entity / task) an engine operates against.
// Empty fields mean "not part of this context".
struct Context {
    std::string project;
    std::string entityType;
    std::string entityName;
    std::string task;

    bool hasEntity() const noexcept { return !entityType.empty() || !entityName.empty(); }
    bool empty() const noexcept { return project.empty() && !hasEntity() && task.empty(); }

    std::string toString() const;

    friend bool operator==(const Context& a, const Context& b) {
        return a.project == b.project && a.entityType == b.entityType &&
               a.entityName == b.entityName && a.task == b.task;
    }
    friend bool operator!=(const Context& a, const Context& b) { return !(a == b); }
};

// Directory (relative to the workspace root) that scopes one entity.
struct EntityScope {
    std::filesystem::path relativeDir;
    std::string entityType;
};

// Resolved project root a document path lives under.
struct Workspace {
    std::string name;
    std::filesystem::path root;
    std::vector<EntityScope> entities;
    std::vector<std::string> tasks;
};

} // namespace scenelink
