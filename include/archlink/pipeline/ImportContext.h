/***
 * Name: archlink::pipeline::ImportContext
 * Purpose: Orchestrate one import: population, hierarchy completion, resolution.
 * Inputs:
 *   - ClassInfo and RawAccessRecord facts from scanner workers (thread-safe)
 *   - Optional Introspector for classes outside the scanned set
 * Outputs:
 *   - ImportResult: the ResolvedModel, aggregated warnings, metrics
 * Theory of Operation:
 *   complete() is the barrier between scanning and resolution. It runs the
 *   HierarchyCompleter (which freezes the registry), then drains the raw
 *   record store through the per-kind resolvers on `jobs` worker threads.
 *   Workers claim records through an atomic index and keep results locally;
 *   after join, results are merged and warnings ordered by record so output
 *   does not depend on scheduling. Expected coverage gaps become warnings;
 *   a ModelInconsistencyError in any worker is rethrown after all workers
 *   have joined.
 */
#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "archlink/access/RawAccessRecord.h"
#include "archlink/access/RawRecordStore.h"
#include "archlink/diag/Diagnostic.h"
#include "archlink/introspect/Introspector.h"
#include "archlink/model/ClassDescriptor.h"
#include "archlink/observability/Metrics.h"
#include "archlink/pipeline/ResolvedModel.h"
#include "archlink/pipeline/ResolverOptions.h"
#include "archlink/registry/ClassRegistry.h"

namespace archlink::pipeline {

struct ImportResult {
    ResolvedModel model;
    std::vector<diag::Diagnostic> warnings;
    obs::Metrics metrics;
};

class ImportContext {
public:
    explicit ImportContext(std::shared_ptr<const introspect::Introspector> introspector = nullptr,
                           ResolverOptions options = {});

    ImportContext(const ImportContext &) = delete;
    ImportContext &operator=(const ImportContext &) = delete;

    model::ClassPtr addClass(const model::ClassInfo &info) { return registry_->put(info); }

    // False for a duplicate of an already registered record.
    bool registerAccess(access::RawAccessRecord record) { return records_.add(std::move(record)); }

    registry::ClassRegistry &registry() { return *registry_; }
    const access::RawRecordStore &records() const { return records_; }
    const ResolverOptions &options() const { return options_; }

    ImportResult complete();

private:
    void logWarning(const diag::Diagnostic &diag);

    ResolverOptions options_;
    std::shared_ptr<registry::ClassRegistry> registry_;
    access::RawRecordStore records_;
    std::mutex logMutex_;
};

} // namespace archlink::pipeline
