/***
 * Name: archlink::hierarchy::isSupertypeOf
 * Purpose: Test proper ancestry through the registry.
 */
#include "archlink/hierarchy/Supertypes.h"

#include <algorithm>

namespace archlink::hierarchy {

bool isSupertypeOf(registry::ClassRegistry &registry, const std::string &ancestor,
                   const model::ClassDescriptor &descendant) {
    const auto closure = supertypeClosure(registry, descendant);
    return std::any_of(closure.begin(), closure.end(),
                       [&ancestor](const model::ClassPtr &cls) { return cls->name() == ancestor; });
}

} // namespace archlink::hierarchy
