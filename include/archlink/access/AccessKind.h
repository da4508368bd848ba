/***
 * Name: archlink::access (access kinds)
 * Purpose: Classify raw and resolved accesses.
 */
#pragma once

#include <string_view>

#include "archlink/model/MemberKind.h"

namespace archlink::access {

enum class AccessKind { FieldAccess, MethodCall, ConstructorCall };

// Field accesses only.
enum class AccessType { Get, Set };

constexpr model::MemberKind memberKindOf(const AccessKind kind) {
    switch (kind) {
        case AccessKind::FieldAccess: return model::MemberKind::Field;
        case AccessKind::MethodCall: return model::MemberKind::Method;
        case AccessKind::ConstructorCall: return model::MemberKind::Constructor;
    }
    return model::MemberKind::Method;
}

constexpr std::string_view accessKindName(const AccessKind kind) {
    switch (kind) {
        case AccessKind::FieldAccess: return "field-access";
        case AccessKind::MethodCall: return "method-call";
        case AccessKind::ConstructorCall: return "constructor-call";
    }
    return "access";
}

constexpr std::string_view accessTypeName(const AccessType type) {
    return type == AccessType::Get ? "get" : "set";
}

} // namespace archlink::access
