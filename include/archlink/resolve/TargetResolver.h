/***
 * Name: archlink::resolve::TargetResolver
 * Purpose: Bind a TargetInfo to the member declaration it refers to.
 * Inputs:
 *   - TargetInfo from a raw access record
 * Outputs:
 *   - Resolution: bound member with binding kind, or a failure
 * Theory of Operation:
 *   1. The declared owner is fetched (lazily loaded when never scanned); an
 *      unloadable owner is a MissingDependency failure.
 *   2. A declaration on the owner itself binds immediately.
 *   3. Ancestors are searched breadth-first (except for constructors); a
 *      same-signature declaration binds only if disambiguate() accepts it.
 *   4. Otherwise the FallbackSynthesizer supplies the member.
 *   A missing dependency met during step 3 degrades to step 4 and is noted.
 *   Subclasses fix the member kind and the conservative synthetic modifiers.
 */
#pragma once

#include <memory>

#include "archlink/access/AccessKind.h"
#include "archlink/access/TargetInfo.h"
#include "archlink/model/MemberKind.h"
#include "archlink/model/Modifiers.h"
#include "archlink/registry/ClassRegistry.h"
#include "archlink/resolve/FallbackSynthesizer.h"
#include "archlink/resolve/Resolution.h"

namespace archlink::resolve {

class TargetResolver {
public:
    explicit TargetResolver(registry::ClassRegistry &registry)
        : registry_(registry), synthesizer_(registry.introspector()) {}

    virtual ~TargetResolver() = default;

    Resolution resolve(const access::TargetInfo &target) const;

    virtual model::MemberKind kind() const = 0;

protected:
    // Weakest legally valid declaration for a synthesized member of this kind.
    virtual model::Modifiers syntheticModifiers() const = 0;

    // Constructors are never inherited.
    virtual bool searchesAncestors() const { return true; }

private:
    Resolution resolveThroughAncestors(const model::ClassDescriptor &owner, const access::TargetInfo &target) const;

    registry::ClassRegistry &registry_;
    FallbackSynthesizer synthesizer_;
};

class FieldResolver final : public TargetResolver {
public:
    using TargetResolver::TargetResolver;
    model::MemberKind kind() const override { return model::MemberKind::Field; }

protected:
    model::Modifiers syntheticModifiers() const override { return model::modifier::kPublic; }
};

class MethodResolver final : public TargetResolver {
public:
    using TargetResolver::TargetResolver;
    model::MemberKind kind() const override { return model::MemberKind::Method; }

protected:
    // Any interface method is exactly public abstract; an undeterminable method is a diamond over interfaces.
    model::Modifiers syntheticModifiers() const override {
        return model::modifier::kPublic | model::modifier::kAbstract;
    }
};

class ConstructorResolver final : public TargetResolver {
public:
    using TargetResolver::TargetResolver;
    model::MemberKind kind() const override { return model::MemberKind::Constructor; }

protected:
    model::Modifiers syntheticModifiers() const override { return model::modifier::kPublic; }
    bool searchesAncestors() const override { return false; }
};

std::unique_ptr<TargetResolver> makeResolver(access::AccessKind kind, registry::ClassRegistry &registry);

} // namespace archlink::resolve
