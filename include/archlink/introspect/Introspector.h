/***
 * Name: archlink::introspect::Introspector
 * Purpose: Interface to the introspection subsystem that can load classes the
 *   scanner never visited and look up members by structural signature.
 * Inputs:
 *   - Dotted type names; member predicates
 * Outputs:
 *   - Optional ClassInfo; matching members with their declaring class
 * Theory of Operation:
 *   Implementations must be safe for concurrent const calls: the registry's
 *   lazy-loading path and the fallback synthesizer call them from resolver
 *   worker threads. A class that cannot be located yields std::nullopt;
 *   implementations may also throw MissingDependencyError when a located
 *   class is unusable because something it depends on is missing.
 */
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "archlink/model/ClassDescriptor.h"
#include "archlink/model/MemberDescriptor.h"
#include "archlink/model/MemberKind.h"

namespace archlink::introspect {

struct IntrospectedMember {
    std::string declaringClass;
    model::MemberInfo member;
};

using MemberPredicate = std::function<bool(const model::MemberInfo &)>;

class Introspector {
public:
    virtual ~Introspector() = default;

    virtual std::optional<model::ClassInfo> loadClass(const std::string &typeName) const = 0;

    // Members visible on typeName (fields and methods include inherited ones) that satisfy predicate.
    virtual std::vector<IntrospectedMember> findMembers(const std::string &typeName, model::MemberKind kind,
                                                        const MemberPredicate &predicate) const = 0;
};

} // namespace archlink::introspect
