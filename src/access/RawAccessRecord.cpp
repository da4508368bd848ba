/***
 * Name: RawAccessRecord (definitions)
 * Purpose: Factories per access kind and a readable rendering.
 */
#include "archlink/access/RawAccessRecord.h"

#include <utility>

namespace archlink::access {

    /*** Name: fieldAccess */
    RawAccessRecord fieldAccess(model::CodeUnit caller, TargetInfo target, const int line, const AccessType type) {
        return RawAccessRecord{std::move(caller), std::move(target), line, AccessKind::FieldAccess, type};
    }

    /*** Name: methodCall */
    RawAccessRecord methodCall(model::CodeUnit caller, TargetInfo target, const int line) {
        return RawAccessRecord{std::move(caller), std::move(target), line, AccessKind::MethodCall, std::nullopt};
    }

    /*** Name: constructorCall */
    RawAccessRecord constructorCall(model::CodeUnit caller, TargetInfo target, const int line) {
        return RawAccessRecord{std::move(caller), std::move(target), line, AccessKind::ConstructorCall, std::nullopt};
    }

    /*** Name: RawAccessRecord::toString */
    std::string RawAccessRecord::toString() const {
        std::string out(accessKindName(kind));
        if (accessType) { out += "{accessType=" + std::string(accessTypeName(*accessType)) + ", "; } else { out += "{"; }
        out += "caller=" + caller.toString() + ", target=" + target.toString() + ", lineNumber=" + std::to_string(line) + "}";
        return out;
    }

} // namespace archlink::access
