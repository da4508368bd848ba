/***
 * Name: archlink::access::ResolvedAccessRecord
 * Purpose: A raw record bound to the concrete declaring member.
 */
#pragma once

#include <optional>
#include <string>

#include "archlink/access/AccessKind.h"
#include "archlink/model/MemberDescriptor.h"
#include "archlink/resolve/Resolution.h"

namespace archlink::access {

struct ResolvedAccessRecord {
    model::MemberPtr caller;
    model::MemberPtr target;
    int line{-1};
    AccessKind kind{AccessKind::MethodCall};
    std::optional<AccessType> accessType{};
    resolve::BindingKind binding{resolve::BindingKind::Declared};

    // Structural: compares the members, not their addresses.
    bool operator==(const ResolvedAccessRecord &other) const {
        return *caller == *other.caller && *target == *other.target && line == other.line &&
               kind == other.kind && accessType == other.accessType && binding == other.binding;
    }

    std::string toString() const;
};

} // namespace archlink::access
