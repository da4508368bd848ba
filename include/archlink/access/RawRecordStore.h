/***
 * Name: archlink::access::RawRecordStore
 * Purpose: Hold raw field-access, method-call and constructor-call records
 *   exactly as captured by the scanner.
 * Theory of Operation:
 *   One hash set per access kind under a single mutex; duplicate records
 *   (equal identity) collapse. Snapshots are sorted so downstream processing
 *   is independent of insertion order.
 */
#pragma once

#include <cstddef>
#include <mutex>
#include <unordered_set>
#include <vector>

#include "archlink/access/RawAccessRecord.h"

namespace archlink::access {

class RawRecordStore {
public:
    // False when an equal record was already registered.
    bool add(RawAccessRecord record);

    std::vector<RawAccessRecord> records(AccessKind kind) const;
    std::size_t size() const;

private:
    using RecordSet = std::unordered_set<RawAccessRecord, RawAccessRecordHash>;

    RecordSet &setFor(AccessKind kind);
    const RecordSet &setFor(AccessKind kind) const;

    mutable std::mutex mutex_;
    RecordSet fieldAccesses_;
    RecordSet methodCalls_;
    RecordSet constructorCalls_;
};

} // namespace archlink::access
