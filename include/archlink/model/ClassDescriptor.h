/***
 * Name: archlink::model::ClassDescriptor
 * Purpose: In-memory representation of one compiled class: name, ancestry, members.
 * Inputs:
 *   - ClassInfo aggregate from the scanner or introspection subsystem
 * Outputs:
 *   - Immutable descriptor shared through ClassPtr
 * Theory of Operation:
 *   Ancestry is kept by name; the ClassRegistry resolves names to descriptors
 *   and keeps the reverse (subclass) index. Members are built once at
 *   construction and owned exclusively by this class.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "archlink/model/MemberDescriptor.h"
#include "archlink/model/MemberKind.h"
#include "archlink/model/Modifiers.h"

namespace archlink::model {

enum class ClassOrigin { Scanned, Introspected };

/***
 * Name: ClassInfo
 * Purpose: Raw class facts: name, supertype names, modifiers, member list.
 */
struct ClassInfo {
    std::string name;
    std::optional<std::string> superclass{};
    std::vector<std::string> interfaces{};
    Modifiers modifiers{0};
    std::vector<MemberInfo> members{};
    ClassOrigin origin{ClassOrigin::Scanned};
};

class ClassDescriptor;
using ClassPtr = std::shared_ptr<const ClassDescriptor>;

class ClassDescriptor {
public:
    explicit ClassDescriptor(const ClassInfo &info);

    static ClassPtr create(const ClassInfo &info) { return std::make_shared<const ClassDescriptor>(info); }

    const std::string &name() const { return name_; }
    const std::optional<std::string> &superclass() const { return superclass_; }
    const std::vector<std::string> &interfaces() const { return interfaces_; }
    Modifiers modifiers() const { return modifiers_; }
    bool isInterface() const { return hasModifier(modifiers_, modifier::kInterface); }
    ClassOrigin origin() const { return origin_; }

    // Superclass first, then interfaces in declaration order.
    std::vector<std::string> directSupertypes() const;

    const std::vector<MemberPtr> &members() const { return members_; }
    std::vector<MemberPtr> membersOfKind(MemberKind kind) const;

    // Methods and constructors, including the static initializer.
    std::vector<MemberPtr> codeUnits() const;

    MemberPtr findDeclared(MemberKind kind, const std::string &name, const std::string &descriptor) const;

    bool declares(MemberKind kind, const std::string &name, const std::string &descriptor) const {
        return findDeclared(kind, name, descriptor) != nullptr;
    }

    // Structural: name, ancestry, modifiers, and member set.
    bool operator==(const ClassDescriptor &other) const;

private:
    std::string name_;
    std::optional<std::string> superclass_;
    std::vector<std::string> interfaces_;
    Modifiers modifiers_;
    ClassOrigin origin_;
    std::vector<MemberPtr> members_;
};

} // namespace archlink::model
