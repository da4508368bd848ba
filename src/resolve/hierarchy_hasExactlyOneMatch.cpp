/***
 * Name: archlink::resolve::hasExactlyOneMatch
 * Purpose: Count declarations of the target signature along a hierarchy path.
 */
#include "archlink/resolve/HierarchyPath.h"

#include <algorithm>

namespace archlink::resolve {

bool hasExactlyOneMatch(const std::vector<model::ClassPtr> &path, const model::MemberKind kind,
                        const access::TargetInfo &target) {
    const auto matching = std::count_if(path.begin(), path.end(), [&](const model::ClassPtr &cls) {
        return cls->declares(kind, target.name, target.descriptor);
    });
    return matching == 1;
}

} // namespace archlink::resolve
