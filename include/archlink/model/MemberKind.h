/***
 * Name: archlink::model::MemberKind
 * Purpose: Distinguish fields, methods, and constructors.
 */
#pragma once

#include <string_view>

namespace archlink::model {

enum class MemberKind { Field, Method, Constructor };

inline constexpr std::string_view kConstructorName = "<init>";
inline constexpr std::string_view kStaticInitializerName = "<clinit>";

constexpr std::string_view memberKindName(MemberKind kind) {
    switch (kind) {
        case MemberKind::Field: return "field";
        case MemberKind::Method: return "method";
        case MemberKind::Constructor: return "constructor";
    }
    return "member";
}

} // namespace archlink::model
