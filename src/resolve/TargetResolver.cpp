/***
 * Name: TargetResolver (definitions)
 * Purpose: Shared resolution algorithm for fields, methods, and constructors.
 */
#include "archlink/resolve/TargetResolver.h"
#include "archlink/exceptions/descriptor_error.h"
#include "archlink/exceptions/missing_dependency_error.h"
#include "archlink/hierarchy/Supertypes.h"
#include "archlink/resolve/HierarchyPath.h"

#include <string>
#include <vector>

namespace archlink::resolve {

    /*** Name: TargetResolver::resolve */
    Resolution TargetResolver::resolve(const access::TargetInfo &target) const {
        model::ClassPtr owner;
        try {
            owner = registry_.getOrLoad(target.owner);
        } catch (const exceptions::MissingDependencyError &e) {
            return Resolution::failed(FailureKind::MissingDependency,
                                      "Can't analyse access to '" + target.toString() +
                                      "' because of missing dependency. Error was: '" + e.what() + "'");
        } catch (const exceptions::DescriptorError &e) {
            return Resolution::failed(FailureKind::MalformedDescriptor,
                                      "Can't analyse access to '" + target.toString() + "' because '" +
                                      target.owner + "' can't be loaded: " + e.what());
        }
        if (!owner) {
            return Resolution::failed(FailureKind::MissingDependency,
                                      "Can't analyse access to '" + target.toString() +
                                      "' because of missing dependency '" + target.owner + "'");
        }
        if (auto declared = owner->findDeclared(kind(), target.name, target.descriptor)) {
            return Resolution::bound(std::move(declared), BindingKind::Declared);
        }
        try {
            return resolveThroughAncestors(*owner, target);
        } catch (const exceptions::DescriptorError &e) {
            return Resolution::failed(FailureKind::MalformedDescriptor,
                                      "Can't analyse access to '" + target.toString() + "': " + e.what());
        }
    }

    /*** Name: TargetResolver::resolveThroughAncestors */
    Resolution TargetResolver::resolveThroughAncestors(const model::ClassDescriptor &owner,
                                                       const access::TargetInfo &target) const {
        bool rejected = false;
        std::string note;
        try {
            const auto ancestors = searchesAncestors() ? hierarchy::supertypeClosure(registry_, owner)
                                                       : std::vector<model::ClassPtr>{};
            for (const auto &ancestor : ancestors) {
                auto member = ancestor->findDeclared(kind(), target.name, target.descriptor);
                if (!member) continue;
                if (disambiguate(registry_, owner, *ancestor, kind(), target) == DiamondVerdict::Accepted) {
                    return Resolution::bound(std::move(member), BindingKind::Inherited);
                }
                rejected = true;
            }
        } catch (const exceptions::MissingDependencyError &e) {
            note = "Can't analyse hierarchy of '" + owner.name() + "' for '" + target.toString() +
                   "' because of missing dependency. Error was: '" + e.what() + "'";
        }
        auto result = synthesizer_.synthesize(kind(), target, syntheticModifiers());
        if (rejected) result.markDiamondRejected();
        if (!note.empty()) result.addNote(std::move(note));
        return result;
    }

    /*** Name: makeResolver */
    std::unique_ptr<TargetResolver> makeResolver(const access::AccessKind kind, registry::ClassRegistry &registry) {
        switch (kind) {
            case access::AccessKind::FieldAccess: return std::make_unique<FieldResolver>(registry);
            case access::AccessKind::ConstructorCall: return std::make_unique<ConstructorResolver>(registry);
            case access::AccessKind::MethodCall: break;
        }
        return std::make_unique<MethodResolver>(registry);
    }

} // namespace archlink::resolve
