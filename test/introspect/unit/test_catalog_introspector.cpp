/***
 * Name: test_catalog_introspector
 * Purpose: Class loading and reflective member search over an in-memory catalog.
 */
#include <gtest/gtest.h>
#include "archlink/introspect/CatalogIntrospector.h"
#include "util/ModelBuilders.h"

using namespace archlink;

namespace {
introspect::CatalogIntrospector catalog() {
  return introspect::CatalogIntrospector({
      testutil::cls("lib.Root", std::nullopt, {}, {testutil::method("id", "()J"), testutil::ctor()}),
      testutil::cls("lib.Mid", "lib.Root", {"lib.Named"}, {testutil::method("id", "()J")}),
      testutil::cls("lib.Leaf", "lib.Mid", {}, {testutil::ctor("(I)V")}),
      testutil::iface("lib.Named", {}, {testutil::method("name", "()Ljava/lang/String;")}),
  });
}

auto anyMember = [](const model::MemberInfo&) { return true; };
}  // namespace

TEST(CatalogIntrospector, LoadClassMarksOrigin) {
  const auto cat = catalog();
  const auto leaf = cat.loadClass("lib.Leaf");
  ASSERT_TRUE(leaf.has_value());
  EXPECT_EQ(leaf->origin, model::ClassOrigin::Introspected);
  EXPECT_EQ(*leaf->superclass, "lib.Mid");
  EXPECT_FALSE(cat.loadClass("lib.Nope").has_value());
  EXPECT_EQ(cat.size(), 4u);
}

TEST(CatalogIntrospector, OverriddenMethodsAreReportedOnce) {
  const auto cat = catalog();
  const auto found = cat.findMembers("lib.Leaf", model::MemberKind::Method, anyMember);
  ASSERT_EQ(found.size(), 2u);
  EXPECT_EQ(found[0].declaringClass, "lib.Mid");
  EXPECT_EQ(found[0].member.name, "id");
  EXPECT_EQ(found[1].declaringClass, "lib.Named");
}

TEST(CatalogIntrospector, ConstructorsComeOnlyFromTheClass) {
  const auto cat = catalog();
  const auto found = cat.findMembers("lib.Leaf", model::MemberKind::Constructor, anyMember);
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0].member.descriptor, "(I)V");
}

TEST(CatalogIntrospector, PredicateFilters) {
  const auto cat = catalog();
  const auto found = cat.findMembers("lib.Leaf", model::MemberKind::Method,
                                     [](const model::MemberInfo& m) { return m.name == "name"; });
  ASSERT_EQ(found.size(), 1u);
  EXPECT_EQ(found[0].member.handle->origin, "catalog:lib.Named#name()Ljava/lang/String;");
  EXPECT_TRUE(cat.findMembers("lib.Nope", model::MemberKind::Method, anyMember).empty());
}
