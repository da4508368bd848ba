/***
 * Name: archlink::resolve::Resolution
 * Purpose: Outcome of resolving one target: a bound member or a structured failure.
 * Theory of Operation:
 *   Resolvers never throw for expected coverage gaps. A failure carries its
 *   kind and a message that the pipeline turns into a warning; a bound
 *   result records how the member was found.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "archlink/model/MemberDescriptor.h"

namespace archlink::resolve {

enum class BindingKind { Declared, Inherited, Introspected, Synthesized };

enum class FailureKind { MissingDependency, MalformedDescriptor };

constexpr std::string_view bindingKindName(const BindingKind kind) {
    switch (kind) {
        case BindingKind::Declared: return "declared";
        case BindingKind::Inherited: return "inherited";
        case BindingKind::Introspected: return "introspected";
        case BindingKind::Synthesized: return "synthesized";
    }
    return "unknown";
}

struct ResolutionFailure {
    FailureKind kind;
    std::string message;
};

class Resolution {
public:
    static Resolution bound(model::MemberPtr member, BindingKind binding, bool diamondRejected = false) {
        Resolution r;
        r.member_ = std::move(member);
        r.binding_ = binding;
        r.diamondRejected_ = diamondRejected;
        return r;
    }

    static Resolution failed(FailureKind kind, std::string message) {
        Resolution r;
        r.failure_ = ResolutionFailure{kind, std::move(message)};
        return r;
    }

    bool isBound() const { return member_ != nullptr; }
    const model::MemberPtr &member() const { return member_; }
    BindingKind binding() const { return binding_; }
    const std::optional<ResolutionFailure> &failure() const { return failure_; }

    // An inherited candidate existed but the disambiguator refused it.
    bool diamondRejected() const { return diamondRejected_; }
    void markDiamondRejected() { diamondRejected_ = true; }

    // Coverage gaps met on the way to a bound result; reported as warnings.
    void addNote(std::string note) { notes_.push_back(std::move(note)); }
    const std::vector<std::string> &notes() const { return notes_; }

private:
    Resolution() = default;

    model::MemberPtr member_{};
    BindingKind binding_{BindingKind::Declared};
    std::optional<ResolutionFailure> failure_{};
    bool diamondRejected_{false};
    std::vector<std::string> notes_{};
};

} // namespace archlink::resolve
