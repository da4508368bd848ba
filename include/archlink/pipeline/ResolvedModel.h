/***
 * Name: archlink::pipeline::ResolvedModel
 * Purpose: The finished, queryable class model handed to rule evaluation.
 * Inputs:
 *   - Completed registry, resolved records grouped by caller
 * Outputs:
 *   - Per-caller field accesses, method calls, constructor calls; class lookups
 * Theory of Operation:
 *   Read-only after construction. Records of one caller are kept sorted by
 *   line then target so repeated imports compare equal.
 */
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "archlink/access/ResolvedAccessRecord.h"
#include "archlink/model/ClassDescriptor.h"
#include "archlink/model/CodeUnit.h"
#include "archlink/registry/ClassRegistry.h"

namespace archlink::pipeline {

class ResolvedModel {
public:
    using RecordIndex = std::map<model::CodeUnit, std::vector<access::ResolvedAccessRecord>>;

    ResolvedModel(std::shared_ptr<const registry::ClassRegistry> registry, std::vector<access::ResolvedAccessRecord> records);

    const std::vector<access::ResolvedAccessRecord> &fieldAccessesFrom(const model::CodeUnit &caller) const;
    const std::vector<access::ResolvedAccessRecord> &methodCallsFrom(const model::CodeUnit &caller) const;
    const std::vector<access::ResolvedAccessRecord> &constructorCallsFrom(const model::CodeUnit &caller) const;

    // Null when the name is not part of the model.
    model::ClassPtr findClass(const std::string &name) const;
    std::vector<model::ClassPtr> classes() const { return registry_->allClasses(); }

    // Every code unit with at least one resolved record, in order.
    std::vector<model::CodeUnit> callers() const;

    std::size_t size() const { return size_; }

private:
    static const std::vector<access::ResolvedAccessRecord> &lookup(const RecordIndex &index,
                                                                  const model::CodeUnit &caller);

    std::shared_ptr<const registry::ClassRegistry> registry_;
    RecordIndex fieldAccesses_;
    RecordIndex methodCalls_;
    RecordIndex constructorCalls_;
    std::size_t size_{0};
};

} // namespace archlink::pipeline
