/***
 * Name: test_hierarchy_path
 * Purpose: Subtype paths and diamond verdicts.
 */
#include <gtest/gtest.h>
#include "archlink/access/TargetInfo.h"
#include "archlink/resolve/HierarchyPath.h"
#include "util/ModelBuilders.h"

using namespace archlink;
using namespace archlink::resolve;

namespace {
std::vector<std::string> names(const std::vector<model::ClassPtr>& path) {
  std::vector<std::string> out;
  for (const auto& cls : path) { out.push_back(cls->name()); }
  return out;
}
}  // namespace

TEST(HierarchyPath, LinearChain) {
  registry::ClassRegistry reg;
  reg.put(testutil::cls("C", std::nullopt));
  reg.put(testutil::cls("B", "C"));
  reg.put(testutil::cls("A", "B"));
  const auto path = hierarchyPath(reg, "A", "C");
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(names(*path), (std::vector<std::string>{"A", "B", "C"}));
  EXPECT_EQ(names(*hierarchyPath(reg, "A", "A")), std::vector<std::string>{"A"});
}

TEST(HierarchyPath, UnrelatedOrReversedHasNoPath) {
  registry::ClassRegistry reg;
  reg.put(testutil::cls("B", std::nullopt));
  reg.put(testutil::cls("A", "B"));
  reg.put(testutil::cls("X", std::nullopt));
  EXPECT_FALSE(hierarchyPath(reg, "B", "A").has_value());
  EXPECT_FALSE(hierarchyPath(reg, "A", "X").has_value());
  EXPECT_FALSE(hierarchyPath(reg, "Missing", "B").has_value());
}

TEST(HierarchyPath, DisjointPathsAreRejected) {
  registry::ClassRegistry reg;
  reg.put(testutil::iface("I"));
  reg.put(testutil::cls("B", std::nullopt, {"I"}));
  reg.put(testutil::cls("C", "B", {"I"}));
  EXPECT_FALSE(hierarchyPath(reg, "C", "I").has_value());
  EXPECT_TRUE(hierarchyPath(reg, "C", "B").has_value());
}

TEST(HierarchyPath, HasExactlyOneMatchCountsDeclarations) {
  registry::ClassRegistry reg;
  reg.put(testutil::cls("C", std::nullopt, {}, {testutil::method("f", "()V")}));
  reg.put(testutil::cls("B", "C", {}, {testutil::method("f", "()V")}));
  reg.put(testutil::cls("A", "B"));
  const auto target = access::TargetInfo::of("A", "f", "()V");
  EXPECT_FALSE(hasExactlyOneMatch(*hierarchyPath(reg, "A", "C"), model::MemberKind::Method, target));
  EXPECT_TRUE(hasExactlyOneMatch(*hierarchyPath(reg, "A", "B"), model::MemberKind::Method, target));
  EXPECT_FALSE(hasExactlyOneMatch(*hierarchyPath(reg, "A", "B"), model::MemberKind::Field, target));
}

TEST(Disambiguate, UniqueAncestorIsAccepted) {
  registry::ClassRegistry reg;
  reg.put(testutil::cls("C", std::nullopt));
  reg.put(testutil::cls("B", "C", {}, {testutil::method("f", "()V")}));
  reg.put(testutil::cls("A", "B"));
  reg.put(testutil::cls("X", std::nullopt, {}, {testutil::method("f", "()V")}));
  const auto target = access::TargetInfo::of("A", "f", "()V");
  EXPECT_EQ(disambiguate(reg, *reg.get("A"), *reg.get("B"), model::MemberKind::Method, target),
            DiamondVerdict::Accepted);
  EXPECT_EQ(disambiguate(reg, *reg.get("A"), *reg.get("X"), model::MemberKind::Method, target),
            DiamondVerdict::NoPath);
}

TEST(Disambiguate, InterfaceExtendingTwoInterfacesIsAmbiguous) {
  registry::ClassRegistry reg;
  reg.put(testutil::iface("I1", {}, {testutil::method("m", "()V")}));
  reg.put(testutil::iface("I2", {}, {testutil::method("m", "()V")}));
  reg.put(testutil::iface("J", {"I1", "I2"}));
  const auto target = access::TargetInfo::of("J", "m", "()V");
  EXPECT_EQ(disambiguate(reg, *reg.get("J"), *reg.get("I1"), model::MemberKind::Method, target),
            DiamondVerdict::MultipleDeclarations);
  EXPECT_EQ(disambiguate(reg, *reg.get("J"), *reg.get("I2"), model::MemberKind::Method, target),
            DiamondVerdict::MultipleDeclarations);
}

TEST(Disambiguate, OverridingSubInterfaceWins) {
  registry::ClassRegistry reg;
  reg.put(testutil::iface("I", {}, {testutil::method("m", "()V")}));
  reg.put(testutil::iface("K", {"I"}, {testutil::method("m", "()V")}));
  reg.put(testutil::cls("X", std::nullopt, {"K"}));
  const auto target = access::TargetInfo::of("X", "m", "()V");
  EXPECT_EQ(disambiguate(reg, *reg.get("X"), *reg.get("K"), model::MemberKind::Method, target),
            DiamondVerdict::Accepted);
}

TEST(Disambiguate, SuperclassBeatsInterfaceDeclaration) {
  registry::ClassRegistry reg;
  reg.put(testutil::iface("I", {}, {testutil::method("m", "()V", model::modifier::kPublic | model::modifier::kAbstract)}));
  reg.put(testutil::cls("B", std::nullopt, {}, {testutil::method("m", "()V")}));
  reg.put(testutil::cls("C", "B", {"I"}));
  const auto target = access::TargetInfo::of("C", "m", "()V");
  EXPECT_EQ(disambiguate(reg, *reg.get("C"), *reg.get("B"), model::MemberKind::Method, target),
            DiamondVerdict::Accepted);
  EXPECT_EQ(disambiguate(reg, *reg.get("C"), *reg.get("I"), model::MemberKind::Method, target),
            DiamondVerdict::MultipleDeclarations);
}

TEST(Disambiguate, VerdictNames) {
  EXPECT_EQ(diamondVerdictName(DiamondVerdict::NoPath), "no-path");
  EXPECT_EQ(diamondVerdictName(DiamondVerdict::MultipleDeclarations), "multiple-declarations");
}
