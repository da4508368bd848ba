/***
 * Name: archlink::resolve (hierarchy path and diamond disambiguation)
 * Purpose: Decide whether an ancestor's declaration is the unique binding for
 *   a reference made through a subtype.
 * Inputs:
 *   - Declared owner of the reference, candidate ancestor declaring the signature
 * Outputs:
 *   - The subtype path between them; a verdict on the candidate
 * Theory of Operation:
 *   hierarchyPath() confirms through the registry's subclass index that the
 *   declared owner is a known subtype of the ancestor, then walks upward one
 *   direct supertype at a time. Exactly one direct supertype may lead towards
 *   the ancestor at each step; several (disjoint paths through different
 *   intermediates) or none leave the path undefined.
 *
 *   disambiguate() accepts the candidate only when it is the single class on
 *   that path declaring the signature. An interface candidate must also be
 *   the only declaration outside its own ancestry: two unrelated interfaces
 *   declaring the same method make both ambiguous. A class candidate is
 *   never vetoed by interface declarations, since the superclass binding
 *   wins.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "archlink/access/TargetInfo.h"
#include "archlink/model/ClassDescriptor.h"
#include "archlink/model/MemberKind.h"
#include "archlink/registry/ClassRegistry.h"

namespace archlink::resolve {

enum class DiamondVerdict { Accepted, NoPath, NoDeclaration, MultipleDeclarations };

constexpr std::string_view diamondVerdictName(const DiamondVerdict verdict) {
    switch (verdict) {
        case DiamondVerdict::Accepted: return "accepted";
        case DiamondVerdict::NoPath: return "no-path";
        case DiamondVerdict::NoDeclaration: return "no-declaration";
        case DiamondVerdict::MultipleDeclarations: return "multiple-declarations";
    }
    return "unknown";
}

/** Ordered chain [from, ..., to]; std::nullopt when no unique path exists. */
std::optional<std::vector<model::ClassPtr>> hierarchyPath(registry::ClassRegistry &registry, const std::string &from,
                                                          const std::string &to);

/** True when exactly one class on the path declares the target's signature. */
bool hasExactlyOneMatch(const std::vector<model::ClassPtr> &path, model::MemberKind kind,
                        const access::TargetInfo &target);

DiamondVerdict disambiguate(registry::ClassRegistry &registry, const model::ClassDescriptor &declaredOwner,
                            const model::ClassDescriptor &candidateOwner, model::MemberKind kind,
                            const access::TargetInfo &target);

} // namespace archlink::resolve
