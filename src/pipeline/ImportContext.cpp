/***
 * Name: ImportContext (definitions)
 * Purpose: Hierarchy completion followed by parallel resolution of raw records.
 */
#include "archlink/pipeline/ImportContext.h"
#include "archlink/exceptions/model_inconsistency_error.h"
#include "archlink/hierarchy/HierarchyCompleter.h"
#include "archlink/resolve/TargetResolver.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <utility>

namespace archlink::pipeline {

    namespace {
        struct WorkerOutput {
            std::vector<access::ResolvedAccessRecord> resolved{};
            std::vector<std::pair<std::size_t, diag::Diagnostic>> warnings{};
            std::map<std::string, std::uint64_t> counters{};
            std::exception_ptr error{};
        };

        /*** Name: findCaller
         *  Purpose: Map a raw caller code unit onto the member declared by its class.
         *  Throws ModelInconsistencyError: scanned callers always belong to scanned classes. */
        model::MemberPtr findCaller(const registry::ClassRegistry &registry, const model::CodeUnit &caller) {
            const auto cls = registry.get(caller.declaringClass);
            if (!cls) {
                throw exceptions::ModelInconsistencyError("Declaring class of caller '" + caller.toString() +
                                                          "' is not part of the import");
            }
            for (const auto &unit : cls->codeUnits()) {
                if (unit->hasSignature(caller.name, caller.descriptor)) return unit;
            }
            throw exceptions::ModelInconsistencyError("Can't find code unit '" + caller.toString() +
                                                      "' in its declaring class");
        }

        unsigned workerCount(const unsigned requested, const std::size_t work) {
            unsigned jobs = requested;
            if (jobs == 0) jobs = std::max(1U, std::thread::hardware_concurrency());
            return static_cast<unsigned>(std::min<std::size_t>(jobs, std::max<std::size_t>(work, 1)));
        }
    } // namespace

    ImportContext::ImportContext(std::shared_ptr<const introspect::Introspector> introspector,
                                 ResolverOptions options)
        : options_(options), registry_(std::make_shared<registry::ClassRegistry>(std::move(introspector))) {}

    void ImportContext::logWarning(const diag::Diagnostic &diag) {
        if (!options_.logWarnings) return;
        const std::lock_guard<std::mutex> lock(logMutex_);
        std::cerr << "archlink: ";
        diag::printDiagnostic(std::cerr, diag, options_.color);
    }

    /***
     * Name: ImportContext::complete
     * Purpose: Finish the import and return the resolved model.
     * Inputs:
     *   - Registry and record store populated since construction
     * Outputs:
     *   - ImportResult with model, warnings in record order, metrics
     * Theory of Operation:
     *   Records of all three kinds are concatenated in a fixed order (field
     *   accesses, method calls, constructor calls; each sorted), so a record's
     *   index is stable and orders its warnings. A record is dropped when its
     *   target cannot be resolved; it is never bound to a guess.
     */
    ImportResult ImportContext::complete() {
        obs::Metrics metrics;
        std::vector<diag::Diagnostic> warnings;

        hierarchy::CompletionReport completion;
        {
            obs::ScopedStage stage(metrics, "HierarchyCompletion");
            completion = hierarchy::HierarchyCompleter(*registry_).run();
        }
        for (auto &warn : completion.warnings) {
            logWarning(warn);
            warnings.push_back(std::move(warn));
        }
        metrics.setCounter("hierarchy.added", completion.added);

        std::vector<access::RawAccessRecord> work;
        for (const auto kind : {access::AccessKind::FieldAccess, access::AccessKind::MethodCall,
                                access::AccessKind::ConstructorCall}) {
            auto records = records_.records(kind);
            work.insert(work.end(), std::make_move_iterator(records.begin()), std::make_move_iterator(records.end()));
        }
        metrics.setCounter("records.raw", work.size());

        const auto fieldResolver = resolve::makeResolver(access::AccessKind::FieldAccess, *registry_);
        const auto methodResolver = resolve::makeResolver(access::AccessKind::MethodCall, *registry_);
        const auto constructorResolver = resolve::makeResolver(access::AccessKind::ConstructorCall, *registry_);
        auto resolverFor = [&](const access::AccessKind kind) -> const resolve::TargetResolver & {
            if (kind == access::AccessKind::FieldAccess) return *fieldResolver;
            if (kind == access::AccessKind::ConstructorCall) return *constructorResolver;
            return *methodResolver;
        };

        std::atomic<std::size_t> next{0};
        std::atomic<bool> abort{false};
        auto runWorker = [&](WorkerOutput &out) {
            try {
                for (std::size_t i = next.fetch_add(1); i < work.size() && !abort.load(); i = next.fetch_add(1)) {
                    const auto &record = work[i];
                    const auto caller = findCaller(*registry_, record.caller);
                    const auto resolution = resolverFor(record.kind).resolve(record.target);
                    for (const auto &note : resolution.notes()) {
                        auto diag = diag::warning(note, record.caller.toString(), record.line);
                        logWarning(diag);
                        out.warnings.emplace_back(i, std::move(diag));
                    }
                    if (!resolution.isBound()) {
                        auto diag = diag::warning(resolution.failure()->message, record.caller.toString(), record.line);
                        logWarning(diag);
                        out.warnings.emplace_back(i, std::move(diag));
                        ++out.counters["records.dropped"];
                        continue;
                    }
                    if (resolution.diamondRejected()) ++out.counters["diamond.rejected"];
                    ++out.counters["bind." + std::string(resolve::bindingKindName(resolution.binding()))];
                    out.resolved.push_back(access::ResolvedAccessRecord{caller, resolution.member(), record.line,
                                                                        record.kind, record.accessType,
                                                                        resolution.binding()});
                }
            } catch (...) {
                out.error = std::current_exception();
                abort.store(true);
            }
        };

        std::vector<WorkerOutput> outputs(workerCount(options_.jobs, work.size()));
        {
            obs::ScopedStage stage(metrics, "Resolution");
            if (outputs.size() == 1) {
                runWorker(outputs.front());
            } else {
                std::vector<std::thread> threads;
                threads.reserve(outputs.size());
                for (auto &out : outputs) threads.emplace_back(runWorker, std::ref(out));
                for (auto &thread : threads) thread.join();
            }
        }
        for (const auto &out : outputs) {
            if (out.error) std::rethrow_exception(out.error);
        }

        std::vector<access::ResolvedAccessRecord> resolved;
        std::vector<std::pair<std::size_t, diag::Diagnostic>> ordered;
        for (auto &out : outputs) {
            resolved.insert(resolved.end(), std::make_move_iterator(out.resolved.begin()),
                            std::make_move_iterator(out.resolved.end()));
            ordered.insert(ordered.end(), std::make_move_iterator(out.warnings.begin()),
                           std::make_move_iterator(out.warnings.end()));
            for (const auto &[key, value] : out.counters) metrics.incCounter(key, value);
        }
        std::stable_sort(ordered.begin(), ordered.end(),
                         [](const auto &a, const auto &b) { return a.first < b.first; });
        for (auto &entry : ordered) warnings.push_back(std::move(entry.second));

        for (const auto *key : {"records.dropped", "diamond.rejected", "bind.declared", "bind.inherited",
                                "bind.introspected", "bind.synthesized"}) {
            metrics.incCounter(key, 0);
        }
        metrics.setCounter("records.resolved", resolved.size());
        metrics.setCounter("registry.classes", registry_->size());
        metrics.setCounter("warnings", warnings.size());

        return ImportResult{ResolvedModel(registry_, std::move(resolved)), std::move(warnings), std::move(metrics)};
    }

} // namespace archlink::pipeline
