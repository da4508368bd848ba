/***
 * Name: archlink::resolve::disambiguate
 * Purpose: Accept an ancestor's declaration only when it is provably the unique binding.
 * Inputs:
 *   - declaredOwner: the class the bytecode named
 *   - candidateOwner: an ancestor declaring the target signature
 * Outputs:
 *   - DiamondVerdict::Accepted, or the reason for rejection
 */
#include "archlink/resolve/HierarchyPath.h"
#include "archlink/hierarchy/Supertypes.h"

#include <algorithm>

namespace archlink::resolve {

DiamondVerdict disambiguate(registry::ClassRegistry &registry, const model::ClassDescriptor &declaredOwner,
                            const model::ClassDescriptor &candidateOwner, const model::MemberKind kind,
                            const access::TargetInfo &target) {
    const auto path = hierarchyPath(registry, declaredOwner.name(), candidateOwner.name());
    if (!path) return DiamondVerdict::NoPath;
    if (!hasExactlyOneMatch(*path, kind, target)) {
        const bool none = std::none_of(path->begin(), path->end(), [&](const model::ClassPtr &cls) {
            return cls->declares(kind, target.name, target.descriptor);
        });
        return none ? DiamondVerdict::NoDeclaration : DiamondVerdict::MultipleDeclarations;
    }

    // A class reached through the superclass chain wins over interface declarations.
    if (!candidateOwner.isInterface()) return DiamondVerdict::Accepted;

    // An interface candidate loses to any declaration on a branch it does not inherit from.
    for (const auto &ancestor : hierarchy::supertypeClosure(registry, declaredOwner)) {
        if (ancestor->name() == candidateOwner.name()) continue;
        if (!ancestor->declares(kind, target.name, target.descriptor)) continue;
        if (!hierarchy::isSupertypeOf(registry, ancestor->name(), candidateOwner)) {
            return DiamondVerdict::MultipleDeclarations;
        }
    }
    return DiamondVerdict::Accepted;
}

} // namespace archlink::resolve
