/***
 * Name: archlink::resolve::FallbackSynthesizer
 * Purpose: Produce a best-effort member when no registry declaration can be bound safely.
 * Inputs:
 *   - Member kind, TargetInfo, conservative modifiers for the kind
 * Outputs:
 *   - Resolution bound as Introspected (a real declaration found by structural
 *     comparison) or Synthesized (descriptor-only stand-in)
 * Theory of Operation:
 *   The introspector is asked for members of the declared owner whose name and
 *   parsed signature equal the target's. Exactly one match is a binding; zero
 *   or several (a diamond seen through reflection) and unloadable owners yield
 *   a DescriptorOnly member carrying only name, descriptor, and the weakest
 *   legal modifiers.
 */
#pragma once

#include "archlink/access/TargetInfo.h"
#include "archlink/introspect/Introspector.h"
#include "archlink/model/MemberDescriptor.h"
#include "archlink/model/MemberKind.h"
#include "archlink/model/Modifiers.h"
#include "archlink/resolve/Resolution.h"

namespace archlink::resolve {

class FallbackSynthesizer {
public:
    // introspector may be null: every fallback is then descriptor-only.
    explicit FallbackSynthesizer(const introspect::Introspector *introspector) : introspector_(introspector) {}

    Resolution synthesize(model::MemberKind kind, const access::TargetInfo &target,
                          model::Modifiers conservativeModifiers) const;

private:
    const introspect::Introspector *introspector_;
};

} // namespace archlink::resolve
