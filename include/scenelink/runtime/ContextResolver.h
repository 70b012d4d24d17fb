#pragma once

#include <scenelink/core/context.h>
#include <scenelink/workspace/WorkspaceProvider.h>

#include <optional>
#include <string>

namespace scenelink::runtime {

enum class ResolveKind {
    Unchanged,    // new empty document: keep whatever is running
    Unresolvable, // no workspace/context for the path: disable
    Same,         // context equals the previous one: keep the engine
    Changed,      // context differs: rebuild
};

constexpr const char* resolveKindName(ResolveKind kind) {
    switch (kind) {
        case ResolveKind::Unchanged: return "unchanged";
        case ResolveKind::Unresolvable: return "unresolvable";
        case ResolveKind::Same: return "same";
        case ResolveKind::Changed: return "changed";
    }
    return "unknown";
}

struct ResolveOutcome {
    ResolveKind kind{ResolveKind::Unchanged};
    std::optional<Context> context;     // Same / Changed
    std::optional<Workspace> workspace; // Same / Changed
    std::string reason;                 // Unresolvable
};

/**
 * @brief Decides what a document change means for the running engine.
 *
 * Stateless apart from the provider reference; identical inputs give identical outcomes
 * as long as the provider's workspace data does not change.
 */
class ContextResolver {
public:
    explicit ContextResolver(const workspace::IWorkspaceProvider& provider)
        : provider_(provider) {}

    ResolveOutcome resolve(const std::string& documentPath,
                           const std::optional<Context>& previousContext) const;

private:
    const workspace::IWorkspaceProvider& provider_;
};

} // namespace scenelink::runtime
