/***
 * Name: archlink::hierarchy::supertypeClosure
 * Purpose: Collect all loadable ancestors of a class in breadth-first order.
 */
#include "archlink/hierarchy/Supertypes.h"

#include <deque>
#include <unordered_set>

namespace archlink::hierarchy {

std::vector<model::ClassPtr> supertypeClosure(registry::ClassRegistry &registry, const model::ClassDescriptor &start) {
    std::vector<model::ClassPtr> out;
    std::unordered_set<std::string> seen{start.name()};
    std::deque<std::string> queue;
    for (const auto &super : start.directSupertypes()) { queue.push_back(super); }
    while (!queue.empty()) {
        const std::string name = queue.front();
        queue.pop_front();
        if (!seen.insert(name).second) { continue; }
        auto cls = registry.getOrLoad(name);
        if (!cls) { continue; }
        for (const auto &super : cls->directSupertypes()) { queue.push_back(super); }
        out.push_back(std::move(cls));
    }
    return out;
}

} // namespace archlink::hierarchy
