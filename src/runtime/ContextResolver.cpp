#include <scenelink/runtime/ContextResolver.h>

#include <spdlog/spdlog.h>

namespace scenelink::runtime {

ResolveOutcome ContextResolver::resolve(const std::string& documentPath,
                                        const std::optional<Context>& previousContext) const {
    ResolveOutcome out;

    // file->new: maintain the current context/engine
    if (documentPath.empty()) {
        out.kind = ResolveKind::Unchanged;
        return out;
    }

    // the document could be in another project altogether
    auto ws = provider_.workspaceFromPath(documentPath);
    if (!ws) {
        out.kind = ResolveKind::Unresolvable;
        out.reason = ws.error().message;
        spdlog::debug("[ContextResolver] No workspace for '{}': {}", documentPath, out.reason);
        return out;
    }

    auto ctx = provider_.contextFromPath(ws.value(), documentPath, previousContext);
    if (!ctx) {
        out.kind = ResolveKind::Unresolvable;
        out.reason = ctx.error().message;
        spdlog::debug("[ContextResolver] No context for '{}' in workspace '{}': {}",
                      documentPath, ws.value().name, out.reason);
        return out;
    }

    out.kind = (previousContext && *previousContext == ctx.value()) ? ResolveKind::Same
                                                                    : ResolveKind::Changed;
    out.context = std::move(ctx).value();
    out.workspace = std::move(ws).value();
    return out;
}

} // namespace scenelink::runtime
