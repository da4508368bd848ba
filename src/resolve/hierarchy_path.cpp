/***
 * Name: archlink::resolve::hierarchyPath
 * Purpose: Linear subtype chain from a declared owner up to an ancestor.
 */
#include "archlink/resolve/HierarchyPath.h"

#include <unordered_set>

namespace archlink::resolve {

std::optional<std::vector<model::ClassPtr>> hierarchyPath(registry::ClassRegistry &registry, const std::string &from,
                                                          const std::string &to) {
    auto current = registry.getOrLoad(from);
    if (!current) return std::nullopt;
    std::vector<model::ClassPtr> path{current};
    if (from == to) return path;

    const auto below = registry.allSubclasses(to);
    if (!below.contains(from)) return std::nullopt;

    std::unordered_set<std::string> seen{from};
    while (current->name() != to) {
        std::vector<std::string> leads;
        for (const auto &super : current->directSupertypes()) {
            if (super == to || below.contains(super)) leads.push_back(super);
        }
        if (leads.size() != 1) return std::nullopt;
        if (!seen.insert(leads.front()).second) return std::nullopt;
        current = registry.getOrLoad(leads.front());
        if (!current) return std::nullopt;
        path.push_back(current);
    }
    return path;
}

} // namespace archlink::resolve
