/***
 * Name: archlink::resolve::FallbackSynthesizer::synthesize
 * Purpose: Introspect for a structurally equal member, else build a descriptor-only one.
 */
#include "archlink/resolve/FallbackSynthesizer.h"
#include "archlink/exceptions/descriptor_error.h"
#include "archlink/exceptions/missing_dependency_error.h"
#include "archlink/model/Descriptor.h"

#include <memory>

namespace archlink::resolve {

static bool matchesStructurally(const model::MemberInfo &member, const std::string &name,
                                const model::TypeSignature &signature, const model::MemberKind kind) {
    if (member.name != name) return false;
    try {
        return model::signatureOf(kind, member.descriptor) == signature;
    } catch (const exceptions::DescriptorError &) {
        return false; // an unreadable declaration cannot match
    }
}

Resolution FallbackSynthesizer::synthesize(const model::MemberKind kind, const access::TargetInfo &target,
                                           const model::Modifiers conservativeModifiers) const {
    const model::TypeSignature wanted = model::signatureOf(kind, target.descriptor);
    std::string note;
    if (introspector_ != nullptr) {
        try {
            const auto found = introspector_->findMembers(target.owner, kind, [&](const model::MemberInfo &member) {
                return matchesStructurally(member, target.name, wanted, kind);
            });
            if (found.size() == 1) {
                auto member = std::make_shared<const model::MemberDescriptor>(found.front().declaringClass,
                                                                              found.front().member);
                return Resolution::bound(std::move(member), BindingKind::Introspected);
            }
        } catch (const exceptions::MissingDependencyError &e) {
            note = "Can't introspect " + std::string(model::memberKindName(kind)) + " " + target.toString() +
                   " because of missing dependency. Error was: '" + std::string(e.what()) + "'";
        }
    }
    auto result = Resolution::bound(
        model::MemberDescriptor::descriptorOnly(kind, target.owner, target.name, target.descriptor,
                                                conservativeModifiers),
        BindingKind::Synthesized);
    if (!note.empty()) result.addNote(std::move(note));
    return result;
}

} // namespace archlink::resolve
