/***
 * Name: MemberDescriptor (definitions)
 * Purpose: Construct members of both provenance variants and guard handle access.
 */
#include "archlink/model/MemberDescriptor.h"
#include "archlink/exceptions/reflection_not_possible_error.h"

#include <utility>

namespace archlink::model {

    MemberDescriptor::MemberDescriptor(std::string owner, const MemberInfo &info)
        : MemberDescriptor(info.kind, owner, info.name, info.descriptor, info.modifiers,
                           MemberProvenance::FullyIntrospected,
                           info.handle ? info.handle : std::optional<MemberHandle>(MemberHandle{owner}),
                           info.annotations) {}

    MemberDescriptor::MemberDescriptor(const MemberKind kind, std::string owner, std::string name,
                                       std::string descriptor, const Modifiers modifiers,
                                       const MemberProvenance provenance, std::optional<MemberHandle> handle,
                                       std::vector<std::string> annotations)
        : kind_(kind),
          owner_(std::move(owner)),
          name_(std::move(name)),
          descriptor_(std::move(descriptor)),
          signature_(signatureOf(kind, descriptor_)),
          modifiers_(modifiers),
          provenance_(provenance),
          handle_(std::move(handle)),
          annotations_(std::move(annotations)) {}

    /*** Name: MemberDescriptor::descriptorOnly */
    MemberPtr MemberDescriptor::descriptorOnly(const MemberKind kind, std::string owner, std::string name,
                                               std::string descriptor, const Modifiers modifiers) {
        // make_shared cannot reach the private constructor. A throwing constructor frees the
        // allocation itself, and shared_ptr deletes the pointer if its control block fails.
        return MemberPtr(new MemberDescriptor(kind, std::move(owner), std::move(name), std::move(descriptor),
                                              modifiers, MemberProvenance::DescriptorOnly, std::nullopt, {}));
    }

    /*** Name: MemberDescriptor::handle */
    const MemberHandle &MemberDescriptor::handle() const {
        if (provenance_ == MemberProvenance::DescriptorOnly || !handle_) {
            throw exceptions::ReflectionNotPossibleError("Can't reflect on " + toString() +
                                                         ": member was synthesized from its descriptor");
        }
        return *handle_;
    }

    /*** Name: MemberDescriptor::toString */
    std::string MemberDescriptor::toString() const {
        if (kind_ == MemberKind::Field) { return owner_ + "." + name_ + ":" + descriptor_; }
        return owner_ + "." + name_ + descriptor_;
    }

    /*** Name: MemberDescriptor::operator== */
    bool MemberDescriptor::operator==(const MemberDescriptor &other) const {
        return kind_ == other.kind_ && owner_ == other.owner_ && name_ == other.name_ &&
               descriptor_ == other.descriptor_ && modifiers_ == other.modifiers_ &&
               provenance_ == other.provenance_ && annotations_ == other.annotations_;
    }

} // namespace archlink::model
