/***
 * Name: archlink::introspect::CatalogIntrospector
 * Purpose: Introspector over an in-memory catalog of class facts (for example a
 *   classpath dump of third-party libraries).
 * Inputs:
 *   - ClassInfo list describing loadable classes
 * Outputs:
 *   - Classes marked Introspected, members with catalog handles
 * Theory of Operation:
 *   The catalog is immutable after construction, so concurrent lookups need
 *   no locking. Member search mirrors runtime reflection: fields and methods
 *   are collected breadth-first over the catalog's supertypes, skipping
 *   declarations overridden by an already collected subtype declaration;
 *   constructors come only from the class itself.
 */
#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "archlink/introspect/Introspector.h"

namespace archlink::introspect {

class CatalogIntrospector : public Introspector {
public:
    explicit CatalogIntrospector(std::vector<model::ClassInfo> classes);

    std::optional<model::ClassInfo> loadClass(const std::string &typeName) const override;

    std::vector<IntrospectedMember> findMembers(const std::string &typeName, model::MemberKind kind,
                                                const MemberPredicate &predicate) const override;

    std::size_t size() const { return classes_.size(); }

private:
    const model::ClassInfo *find(const std::string &typeName) const;

    bool isSupertypeOf(const std::string &ancestor, const std::string &descendant) const;

    std::unordered_map<std::string, model::ClassInfo> classes_;
};

} // namespace archlink::introspect
