/***
 * Name: archlink::access::RawAccessRecord
 * Purpose: Unresolved access fact captured by the scanner.
 * Theory of Operation:
 *   Identity is (caller, target, line), plus the access type for field
 *   accesses so that a read and a write of one field on one line (compound
 *   assignment) stay two records.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "archlink/access/AccessKind.h"
#include "archlink/access/TargetInfo.h"
#include "archlink/model/CodeUnit.h"

namespace archlink::access {

struct RawAccessRecord {
    model::CodeUnit caller;
    TargetInfo target;
    int line{-1};
    AccessKind kind{AccessKind::MethodCall};
    std::optional<AccessType> accessType{};

    bool operator==(const RawAccessRecord &other) const {
        return caller == other.caller && target == other.target && line == other.line && kind == other.kind &&
               accessType == other.accessType;
    }

    std::string toString() const;
};

struct RawAccessRecordHash {
    std::size_t operator()(const RawAccessRecord &record) const noexcept {
        std::size_t seed = model::CodeUnitHash{}(record.caller);
        seed ^= TargetInfoHash{}(record.target) + 0x9e3779b9U + (seed << 6U) + (seed >> 2U);
        seed ^= static_cast<std::size_t>(record.line) + 0x9e3779b9U + (seed << 6U) + (seed >> 2U);
        return seed;
    }
};

RawAccessRecord fieldAccess(model::CodeUnit caller, TargetInfo target, int line, AccessType type);
RawAccessRecord methodCall(model::CodeUnit caller, TargetInfo target, int line);
RawAccessRecord constructorCall(model::CodeUnit caller, TargetInfo target, int line);

} // namespace archlink::access
