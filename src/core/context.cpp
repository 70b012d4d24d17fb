#include <scenelink/core/context.h>

namespace scenelink {

std::string Context::toString() const {
    if (empty()) {
        return "<empty context>";
    }
    std::string out = project.empty() ? "<no project>" : project;
    if (hasEntity()) {
        out += ", ";
        out += entityType;
        if (!entityName.empty()) {
            out += " ";
            out += entityName;
        }
    }
    if (!task.empty()) {
        out += ", task ";
        out += task;
    }
    return out;
}

} // namespace scenelink
