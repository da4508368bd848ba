/***
 * Name: ResolvedModel (definitions)
 * Purpose: Index resolved records by caller code unit and access kind.
 */
#include "archlink/pipeline/ResolvedModel.h"

#include <algorithm>
#include <set>
#include <tuple>
#include <utility>

namespace archlink::pipeline {

    namespace {
        bool recordLess(const access::ResolvedAccessRecord &a, const access::ResolvedAccessRecord &b) {
            return std::tie(a.line, a.target->owner(), a.target->name(), a.target->descriptor(), a.accessType) <
                   std::tie(b.line, b.target->owner(), b.target->name(), b.target->descriptor(), b.accessType);
        }
    } // namespace

    /*** Name: ResolvedModel::ResolvedModel */
    ResolvedModel::ResolvedModel(std::shared_ptr<const registry::ClassRegistry> registry,
                                 std::vector<access::ResolvedAccessRecord> records)
        : registry_(std::move(registry)), size_(records.size()) {
        for (auto &record : records) {
            const model::CodeUnit caller{record.caller->owner(), record.caller->name(), record.caller->descriptor()};
            RecordIndex *index = &methodCalls_;
            if (record.kind == access::AccessKind::FieldAccess) index = &fieldAccesses_;
            if (record.kind == access::AccessKind::ConstructorCall) index = &constructorCalls_;
            (*index)[caller].push_back(std::move(record));
        }
        for (RecordIndex *index : {&fieldAccesses_, &methodCalls_, &constructorCalls_}) {
            for (auto &[caller, list] : *index) {
                std::sort(list.begin(), list.end(), recordLess);
            }
        }
    }

    const std::vector<access::ResolvedAccessRecord> &ResolvedModel::lookup(const RecordIndex &index,
                                                                           const model::CodeUnit &caller) {
        static const std::vector<access::ResolvedAccessRecord> kEmpty{};
        const auto it = index.find(caller);
        return it == index.end() ? kEmpty : it->second;
    }

    const std::vector<access::ResolvedAccessRecord> &
    ResolvedModel::fieldAccessesFrom(const model::CodeUnit &caller) const {
        return lookup(fieldAccesses_, caller);
    }

    const std::vector<access::ResolvedAccessRecord> &
    ResolvedModel::methodCallsFrom(const model::CodeUnit &caller) const {
        return lookup(methodCalls_, caller);
    }

    const std::vector<access::ResolvedAccessRecord> &
    ResolvedModel::constructorCallsFrom(const model::CodeUnit &caller) const {
        return lookup(constructorCalls_, caller);
    }

    model::ClassPtr ResolvedModel::findClass(const std::string &name) const { return registry_->get(name); }

    /*** Name: ResolvedModel::callers */
    std::vector<model::CodeUnit> ResolvedModel::callers() const {
        std::set<model::CodeUnit> all;
        for (const RecordIndex *index : {&fieldAccesses_, &methodCalls_, &constructorCalls_}) {
            for (const auto &entry : *index) all.insert(entry.first);
        }
        return std::vector<model::CodeUnit>(all.begin(), all.end());
    }

} // namespace archlink::pipeline
