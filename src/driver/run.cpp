/***
 * Name: archlink::driver::Run
 * Purpose: Execute one import end-to-end for the CLI.
 * Inputs:
 *   - opts: parsed command line
 * Outputs:
 *   - Resolved accesses and optional metrics on stdout; warnings on stderr
 * Theory of Operation:
 *   Classpath dumps feed a CatalogIntrospector (their access lines are
 *   ignored); scan dumps feed the ImportContext. Warnings stream to stderr
 *   while importing unless --quiet.
 */
#include "archlink/driver/app.h"
#include "archlink/exceptions/dump_parse_error.h"
#include "archlink/exceptions/file_read_error.h"
#include "archlink/exceptions/model_inconsistency_error.h"
#include "archlink/introspect/CatalogIntrospector.h"
#include "archlink/pipeline/ImportContext.h"

#include <iostream>
#include <memory>
#include <utility>
#include <vector>

namespace archlink::driver {

auto Run(const cli::Options& opts) -> int {
  if (opts.inputs.empty()) {
    std::cerr << "archlink: no input files provided\n";
    return 2;
  }
  try {
    std::vector<model::ClassInfo> catalog;
    for (const auto& path : opts.classpath) {
      auto dump = LoadDump(path);
      for (auto& cls : dump.classes) {
        catalog.push_back(std::move(cls));
      }
    }
    std::shared_ptr<const introspect::Introspector> introspector;
    if (!catalog.empty()) {
      introspector = std::make_shared<introspect::CatalogIntrospector>(std::move(catalog));
    }

    const pipeline::ResolverOptions resolverOptions{opts.jobs, !opts.quiet, UseColor(opts.color)};
    pipeline::ImportContext context(introspector, resolverOptions);
    for (const auto& path : opts.inputs) {
      auto dump = LoadDump(path);
      for (const auto& cls : dump.classes) {
        context.addClass(cls);
      }
      for (auto& record : dump.accesses) {
        context.registerAccess(std::move(record));
      }
    }

    const auto result = context.complete();
    PrintModel(std::cout, result.model, opts.caller);
    ReportMetricsIfRequested(opts, result.metrics, std::cout);
    return 0;
  } catch (const exceptions::FileReadError& e) {
    std::cerr << "archlink: " << e.what() << "\n";
    return 2;
  } catch (const exceptions::DumpParseError& e) {
    std::cerr << "archlink: " << e.what() << "\n";
    return 2;
  } catch (const exceptions::ModelInconsistencyError& e) {
    std::cerr << "archlink: internal error: " << e.what() << "\n";
    return 1;
  }
}

}  // namespace archlink::driver
