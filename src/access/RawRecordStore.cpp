/***
 * Name: RawRecordStore (definitions)
 * Purpose: Thread-safe registration and sorted snapshots of raw records.
 */
#include "archlink/access/RawRecordStore.h"

#include <algorithm>
#include <tuple>
#include <utility>

namespace archlink::access {

    /*** Name: RawRecordStore::setFor */
    RawRecordStore::RecordSet &RawRecordStore::setFor(const AccessKind kind) {
        switch (kind) {
            case AccessKind::FieldAccess: return fieldAccesses_;
            case AccessKind::ConstructorCall: return constructorCalls_;
            case AccessKind::MethodCall: break;
        }
        return methodCalls_;
    }

    const RawRecordStore::RecordSet &RawRecordStore::setFor(const AccessKind kind) const {
        return const_cast<RawRecordStore *>(this)->setFor(kind);
    }

    /*** Name: RawRecordStore::add */
    bool RawRecordStore::add(RawAccessRecord record) {
        std::lock_guard<std::mutex> lock(mutex_);
        const AccessKind kind = record.kind;
        return setFor(kind).insert(std::move(record)).second;
    }

    /*** Name: RawRecordStore::records */
    std::vector<RawAccessRecord> RawRecordStore::records(const AccessKind kind) const {
        std::vector<RawAccessRecord> out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto &set = setFor(kind);
            out.assign(set.begin(), set.end());
        }
        std::sort(out.begin(), out.end(), [](const RawAccessRecord &a, const RawAccessRecord &b) {
            return std::tie(a.caller, a.line, a.target.owner, a.target.name, a.target.descriptor, a.accessType) <
                   std::tie(b.caller, b.line, b.target.owner, b.target.name, b.target.descriptor, b.accessType);
        });
        return out;
    }

    /*** Name: RawRecordStore::size */
    std::size_t RawRecordStore::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fieldAccesses_.size() + methodCalls_.size() + constructorCalls_.size();
    }

} // namespace archlink::access
