/***
 * Name: archlink::model::MemberDescriptor
 * Purpose: Immutable description of a field, method, or constructor declaration.
 * Inputs:
 *   - MemberInfo from the scanner or introspector, or a bare descriptor for
 *     synthesized stand-ins
 * Outputs:
 *   - Name, descriptor, parsed signature, modifiers, annotations, provenance
 * Theory of Operation:
 *   Two provenance variants share one type. FullyIntrospected members are
 *   backed by a real declaration and expose its MemberHandle. DescriptorOnly
 *   members are synthesized from signature text: they answer every query that
 *   the descriptor can answer and throw ReflectionNotPossibleError from
 *   handle(). Callers branch on isIntrospected() before asking for handles.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "archlink/model/Descriptor.h"
#include "archlink/model/MemberKind.h"
#include "archlink/model/Modifiers.h"

namespace archlink::model {

enum class MemberProvenance { FullyIntrospected, DescriptorOnly };

/***
 * Name: MemberHandle
 * Purpose: Opaque reference to the real declaration, issued by its producer
 *   (class file location for scanned members, catalog key for introspected ones).
 */
struct MemberHandle {
    std::string origin;

    bool operator==(const MemberHandle& other) const = default;
};

/***
 * Name: MemberInfo
 * Purpose: Raw member facts as delivered by the scanner or introspector.
 */
struct MemberInfo {
    MemberKind kind{MemberKind::Method};
    std::string name;
    std::string descriptor;
    Modifiers modifiers{0};
    std::vector<std::string> annotations{};
    std::optional<MemberHandle> handle{};
};

class MemberDescriptor;
using MemberPtr = std::shared_ptr<const MemberDescriptor>;

class MemberDescriptor {
public:
    // Fully introspected member owned by `owner`; a missing handle defaults to the owner name.
    MemberDescriptor(std::string owner, const MemberInfo &info);

    static MemberPtr descriptorOnly(MemberKind kind, std::string owner, std::string name,
                                    std::string descriptor, Modifiers modifiers);

    MemberKind kind() const { return kind_; }
    const std::string &owner() const { return owner_; }
    const std::string &name() const { return name_; }
    const std::string &descriptor() const { return descriptor_; }
    const TypeSignature &signature() const { return signature_; }
    Modifiers modifiers() const { return modifiers_; }
    const std::vector<std::string> &annotations() const { return annotations_; }
    MemberProvenance provenance() const { return provenance_; }
    bool isIntrospected() const { return provenance_ == MemberProvenance::FullyIntrospected; }

    bool hasSignature(const std::string &name, const std::string &descriptor) const {
        return name_ == name && descriptor_ == descriptor;
    }

    // Throws ReflectionNotPossibleError for descriptor-only members.
    const MemberHandle &handle() const;

    // "a.B.m(I)V" for methods and constructors, "a.B.f:I" for fields.
    std::string toString() const;

    bool operator==(const MemberDescriptor &other) const;

private:
    MemberDescriptor(MemberKind kind, std::string owner, std::string name, std::string descriptor,
                     Modifiers modifiers, MemberProvenance provenance, std::optional<MemberHandle> handle,
                     std::vector<std::string> annotations);

    MemberKind kind_;
    std::string owner_;
    std::string name_;
    std::string descriptor_;
    TypeSignature signature_;
    Modifiers modifiers_;
    MemberProvenance provenance_;
    std::optional<MemberHandle> handle_;
    std::vector<std::string> annotations_;
};

} // namespace archlink::model
