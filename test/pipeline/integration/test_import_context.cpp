/***
 * Name: test_import_context
 * Purpose: End-to-end import: completion, parallel resolution, warnings, metrics, model queries.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "archlink/exceptions/model_inconsistency_error.h"
#include "archlink/introspect/CatalogIntrospector.h"
#include "archlink/pipeline/ImportContext.h"
#include "util/ModelBuilders.h"

using namespace archlink;
using access::TargetInfo;
using resolve::BindingKind;

namespace {

const model::CodeUnit kRun = testutil::unit("com.example.Derived", "run", "()V");

void scanBaseDerived(pipeline::ImportContext& ctx) {
  ctx.addClass(testutil::cls("com.example.Base", "java.lang.Object", {},
                             {testutil::method("count", "()I"), testutil::ctor()}));
  ctx.addClass(testutil::cls("com.example.Derived", "com.example.Base", {},
                             {testutil::method("run", "()V"), testutil::ctor(), testutil::field("hits", "I")}));
  ctx.registerAccess(access::methodCall(kRun, TargetInfo::of("com/example/Derived", "count", "()I"), 5));
  ctx.registerAccess(access::fieldAccess(kRun, TargetInfo::of("com/example/Derived", "hits", "I"), 6, access::AccessType::Get));
  ctx.registerAccess(access::fieldAccess(kRun, TargetInfo::of("com/example/Derived", "hits", "I"), 6, access::AccessType::Set));
  ctx.registerAccess(access::constructorCall(kRun, TargetInfo::of("com/example/Base", "<init>", "()V"), 7));
}

std::shared_ptr<introspect::CatalogIntrospector> jdk() {
  return std::make_shared<introspect::CatalogIntrospector>(std::vector<model::ClassInfo>{
      testutil::cls("java.lang.Object", std::nullopt, {}, {testutil::method("hashCode", "()I"), testutil::ctor()}),
  });
}

}  // namespace

TEST(ImportContext, BaseDerivedCountResolvesToBase) {
  pipeline::ImportContext ctx(jdk());
  scanBaseDerived(ctx);
  const auto result = ctx.complete();

  const auto& calls = result.model.methodCallsFrom(kRun);
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].target->owner(), "com.example.Base");
  EXPECT_EQ(calls[0].target->name(), "count");
  EXPECT_EQ(calls[0].target->descriptor(), "()I");
  EXPECT_EQ(calls[0].binding, BindingKind::Inherited);
  EXPECT_EQ(calls[0].line, 5);
  EXPECT_EQ(calls[0].caller->toString(), "com.example.Derived.run()V");

  const auto& fields = result.model.fieldAccessesFrom(kRun);
  ASSERT_EQ(fields.size(), 2u);
  EXPECT_EQ(fields[0].binding, BindingKind::Declared);
  EXPECT_EQ(result.model.constructorCallsFrom(kRun).size(), 1u);
  EXPECT_TRUE(result.warnings.empty());

  ASSERT_NE(result.model.findClass("java.lang.Object"), nullptr);
  EXPECT_EQ(result.model.findClass("java.lang.Object")->origin(), model::ClassOrigin::Introspected);
  EXPECT_EQ(result.model.classes().size(), 3u);
  EXPECT_EQ(result.model.callers(), std::vector<model::CodeUnit>{kRun});
  EXPECT_EQ(result.model.size(), 4u);
}

TEST(ImportContext, UnknownThirdPartyFieldIsIntrospectedWhenLoadable) {
  auto catalog = std::make_shared<introspect::CatalogIntrospector>(std::vector<model::ClassInfo>{
      testutil::cls("lib.Widget", std::nullopt, {}, {testutil::field("size", "J", model::modifier::kPublic | model::modifier::kFinal)}),
  });
  pipeline::ImportContext ctx(catalog);
  ctx.addClass(testutil::cls("app.Main", std::nullopt, {}, {testutil::method("run", "()V")}));
  const auto caller = testutil::unit("app.Main");
  ctx.registerAccess(access::fieldAccess(caller, TargetInfo::of("lib/Widget", "size", "J"), 3, access::AccessType::Get));
  ctx.registerAccess(access::fieldAccess(caller, TargetInfo::of("lib/Widget", "weight", "D"), 4, access::AccessType::Get));
  const auto result = ctx.complete();

  const auto& fields = result.model.fieldAccessesFrom(caller);
  ASSERT_EQ(fields.size(), 2u);
  EXPECT_TRUE(fields[0].target->isIntrospected());
  EXPECT_EQ(fields[0].target->modifiers(), model::modifier::kPublic | model::modifier::kFinal);
  EXPECT_EQ(fields[0].target->handle().origin, "catalog:lib.Widget#sizeJ");

  EXPECT_EQ(fields[1].binding, BindingKind::Synthesized);
  EXPECT_FALSE(fields[1].target->isIntrospected());
  EXPECT_EQ(fields[1].target->owner(), "lib.Widget");
  EXPECT_EQ(fields[1].target->name(), "weight");
  EXPECT_EQ(fields[1].target->descriptor(), "D");
  EXPECT_EQ(fields[1].target->modifiers(), model::modifier::kPublic);
  EXPECT_EQ(result.metrics.counter("bind.synthesized"), 1u);
}

TEST(ImportContext, StaleScanIsCompletedByIntrospection) {
  auto catalog = std::make_shared<introspect::CatalogIntrospector>(std::vector<model::ClassInfo>{
      testutil::cls("lib.Widget", std::nullopt, {}, {testutil::method("resize", "(II)V")}),
  });
  pipeline::ImportContext ctx(catalog);
  ctx.addClass(testutil::cls("lib.Widget", std::nullopt));
  ctx.addClass(testutil::cls("app.Main", std::nullopt, {}, {testutil::method("run", "()V")}));
  ctx.registerAccess(access::methodCall(testutil::unit("app.Main"), TargetInfo::of("lib.Widget", "resize", "(II)V"), 9));
  const auto result = ctx.complete();
  const auto& calls = result.model.methodCallsFrom(testutil::unit("app.Main"));
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].binding, BindingKind::Introspected);
  EXPECT_TRUE(calls[0].target->isIntrospected());
  EXPECT_EQ(result.metrics.counter("bind.introspected"), 1u);
}

TEST(ImportContext, MissingOwnerDropsOnlyThatRecord) {
  pipeline::ImportContext ctx;
  scanBaseDerived(ctx);
  ctx.registerAccess(access::methodCall(kRun, TargetInfo::of("org/gone/Thing", "go", "()V"), 8));
  const auto result = ctx.complete();

  EXPECT_EQ(result.model.methodCallsFrom(kRun).size(), 1u);
  EXPECT_EQ(result.model.size(), 4u);
  EXPECT_EQ(result.metrics.counter("records.raw"), 5u);
  EXPECT_EQ(result.metrics.counter("records.dropped"), 1u);
  ASSERT_EQ(result.warnings.size(), 2u);
  // Base's ancestor java.lang.Object is unknown without a catalog.
  EXPECT_EQ(result.warnings[0].message,
            "Can't analyse related type of 'com.example.Base' because of missing dependency 'java.lang.Object'");
  EXPECT_EQ(result.warnings[1].subject, "com.example.Derived.run()V");
  EXPECT_EQ(result.warnings[1].line, 8);
  EXPECT_NE(result.warnings[1].message.find("org.gone.Thing"), std::string::npos);
  EXPECT_EQ(result.metrics.counter("warnings"), 2u);
}

TEST(ImportContext, DiamondsFallBackAndAreCounted) {
  pipeline::ImportContext ctx;
  ctx.addClass(testutil::iface("p.I1", {}, {testutil::method("m", "()V", model::modifier::kPublic | model::modifier::kAbstract)}));
  ctx.addClass(testutil::iface("p.I2", {}, {testutil::method("m", "()V", model::modifier::kPublic | model::modifier::kAbstract)}));
  ctx.addClass(testutil::iface("p.J", {"p.I1", "p.I2"}));
  ctx.addClass(testutil::cls("p.C", std::nullopt, {"p.I1", "p.I2"}, {testutil::method("run", "()V")}));
  const auto caller = testutil::unit("p.C");
  ctx.registerAccess(access::methodCall(caller, TargetInfo::of("p/J", "m", "()V"), 1));
  ctx.registerAccess(access::methodCall(caller, TargetInfo::of("p/C", "m", "()V"), 2));
  const auto result = ctx.complete();

  const auto& calls = result.model.methodCallsFrom(caller);
  ASSERT_EQ(calls.size(), 2u);
  for (const auto& call : calls) {
    EXPECT_EQ(call.binding, BindingKind::Synthesized);
    EXPECT_EQ(call.target->modifiers(), model::modifier::kPublic | model::modifier::kAbstract);
  }
  EXPECT_EQ(calls[0].target->owner(), "p.J");
  EXPECT_EQ(calls[1].target->owner(), "p.C");
  EXPECT_EQ(result.metrics.counter("diamond.rejected"), 2u);
  const auto hints = result.metrics.hints();
  EXPECT_NE(std::find(hints.begin(), hints.end(), "diamond_fallbacks"), hints.end());
}

TEST(ImportContext, MalformedCatalogClassDoesNotAbortTheBatch) {
  auto catalog = std::make_shared<introspect::CatalogIntrospector>(std::vector<model::ClassInfo>{
      testutil::cls("lib.Bad", std::nullopt, {}, {testutil::method("m", "(Q)V")}),
  });
  pipeline::ImportContext ctx(catalog);
  ctx.addClass(testutil::cls("app.A", std::nullopt, {}, {testutil::method("run", "()V"), testutil::method("ok", "()V")}));
  const auto caller = testutil::unit("app.A");
  ctx.registerAccess(access::methodCall(caller, TargetInfo::of("app/A", "ok", "()V"), 1));
  ctx.registerAccess(access::methodCall(caller, TargetInfo::of("lib/Bad", "x", "()V"), 2));

  pipeline::ImportResult result = ctx.complete();
  const auto& calls = result.model.methodCallsFrom(caller);
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0].target->toString(), "app.A.ok()V");
  EXPECT_EQ(calls[0].binding, BindingKind::Declared);
  EXPECT_EQ(result.metrics.counter("records.dropped"), 1u);
  ASSERT_EQ(result.warnings.size(), 1u);
  EXPECT_EQ(result.warnings[0].line, 2);
  EXPECT_NE(result.warnings[0].message.find("lib.Bad"), std::string::npos);
}

TEST(ImportContext, RepeatedAndParallelImportsAreEqual) {
  auto runImport = [](unsigned jobs) {
    pipeline::ImportContext ctx(jdk(), pipeline::ResolverOptions{jobs, false, false});
    scanBaseDerived(ctx);
    for (int i = 0; i < 200; ++i) {
      ctx.registerAccess(access::methodCall(kRun, TargetInfo::of("com/example/Derived", i % 2 == 0 ? "count" : "hashCode", "()I"), 100 + i));
    }
    ctx.registerAccess(access::methodCall(kRun, TargetInfo::of("gone/X", "y", "()V"), 1));
    return ctx.complete();
  };
  const auto serial = runImport(1);
  const auto again = runImport(1);
  const auto parallel = runImport(4);
  const auto automatic = runImport(0);

  for (const auto* other : {&again, &parallel, &automatic}) {
    EXPECT_EQ(other->model.methodCallsFrom(kRun), serial.model.methodCallsFrom(kRun));
    EXPECT_EQ(other->model.fieldAccessesFrom(kRun), serial.model.fieldAccessesFrom(kRun));
    ASSERT_EQ(other->warnings.size(), serial.warnings.size());
    for (std::size_t i = 0; i < serial.warnings.size(); ++i) {
      EXPECT_EQ(other->warnings[i].message, serial.warnings[i].message);
    }
    EXPECT_EQ(other->metrics.counters(), serial.metrics.counters());
  }
  EXPECT_EQ(serial.model.methodCallsFrom(kRun).size(), 201u);
  EXPECT_EQ(serial.metrics.counter("bind.inherited"), 201u);
}

TEST(ImportContext, EveryCallerExistsInItsDeclaringClass) {
  pipeline::ImportContext ctx(jdk());
  scanBaseDerived(ctx);
  const auto result = ctx.complete();
  for (const auto& caller : result.model.callers()) {
    const auto cls = result.model.findClass(caller.declaringClass);
    ASSERT_NE(cls, nullptr);
    bool found = false;
    for (const auto& unit : cls->codeUnits()) { found = found || unit->hasSignature(caller.name, caller.descriptor); }
    EXPECT_TRUE(found) << caller.toString();
  }
}

TEST(ImportContext, UnknownCallerIsFatal) {
  pipeline::ImportContext ctx(nullptr, pipeline::ResolverOptions{3, false, false});
  scanBaseDerived(ctx);
  ctx.registerAccess(access::methodCall(testutil::unit("com.example.Derived", "absent", "()V"),
                                        TargetInfo::of("com.example.Base", "count", "()I"), 1));
  EXPECT_THROW(ctx.complete(), exceptions::ModelInconsistencyError);
}

TEST(ImportContext, RegistryIsFrozenAfterCompletion) {
  pipeline::ImportContext ctx;
  scanBaseDerived(ctx);
  (void)ctx.complete();
  EXPECT_EQ(ctx.registry().phase(), registry::RegistryPhase::Completed);
  EXPECT_THROW(ctx.addClass(testutil::cls("late.Class", std::nullopt)), exceptions::ModelInconsistencyError);
}

TEST(ImportContext, MetricsCoverStagesAndCounters) {
  pipeline::ImportContext ctx(jdk());
  scanBaseDerived(ctx);
  const auto result = ctx.complete();
  const auto& m = result.metrics;
  EXPECT_TRUE(m.durations().contains("HierarchyCompletion"));
  EXPECT_TRUE(m.durations().contains("Resolution"));
  EXPECT_EQ(m.counter("registry.classes"), 3u);
  EXPECT_EQ(m.counter("hierarchy.added"), 1u);
  EXPECT_EQ(m.counter("records.raw"), 4u);
  EXPECT_EQ(m.counter("records.resolved"), 4u);
  EXPECT_EQ(m.counter("bind.declared"), 3u);
  EXPECT_EQ(m.counter("bind.inherited"), 1u);
  EXPECT_TRUE(m.counters().contains("records.dropped"));
  EXPECT_NE(m.summaryJson().find("\"hierarchycompletion\""), std::string::npos);
}
