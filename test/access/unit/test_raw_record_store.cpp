/***
 * Name: test_raw_record_store
 * Purpose: Record identity, deduplication, sorted snapshots, target normalisation.
 */
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

#include "archlink/access/RawRecordStore.h"
#include "archlink/access/TargetInfo.h"
#include "util/ModelBuilders.h"

using namespace archlink;
using namespace archlink::access;

TEST(TargetInfo, NormalisesOwner) {
  const auto t = TargetInfo::of("com/example/Foo", "bar", "()V");
  EXPECT_EQ(t.owner, "com.example.Foo");
  EXPECT_EQ(TargetInfo::of("[Lcom/example/Foo;", "clone", "()Ljava/lang/Object;").owner, "com.example.Foo[]");
  EXPECT_EQ(t, TargetInfo::of("com.example.Foo", "bar", "()V"));
  EXPECT_EQ(t.toString(), "{owner='com.example.Foo', name='bar', desc='()V'}");
}

TEST(RawRecordStore, DuplicatesCollapse) {
  RawRecordStore store;
  const auto caller = testutil::unit("A");
  EXPECT_TRUE(store.add(methodCall(caller, TargetInfo::of("B", "f", "()V"), 10)));
  EXPECT_FALSE(store.add(methodCall(caller, TargetInfo::of("B", "f", "()V"), 10)));
  EXPECT_TRUE(store.add(methodCall(caller, TargetInfo::of("B", "f", "()V"), 11)));
  EXPECT_EQ(store.size(), 2u);
}

TEST(RawRecordStore, CompoundAssignmentKeepsReadAndWrite) {
  RawRecordStore store;
  const auto caller = testutil::unit("A");
  const auto target = TargetInfo::of("A", "count", "I");
  EXPECT_TRUE(store.add(fieldAccess(caller, target, 7, AccessType::Get)));
  EXPECT_TRUE(store.add(fieldAccess(caller, target, 7, AccessType::Set)));
  EXPECT_EQ(store.records(AccessKind::FieldAccess).size(), 2u);
  EXPECT_TRUE(store.records(AccessKind::MethodCall).empty());
}

TEST(RawRecordStore, SnapshotIsSortedIndependentOfInsertionOrder) {
  RawRecordStore store;
  store.add(constructorCall(testutil::unit("b.B"), TargetInfo::of("x.X", "<init>", "()V"), 3));
  store.add(constructorCall(testutil::unit("a.A"), TargetInfo::of("x.X", "<init>", "()V"), 9));
  store.add(constructorCall(testutil::unit("a.A"), TargetInfo::of("x.X", "<init>", "()V"), 2));
  const auto records = store.records(AccessKind::ConstructorCall);
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0].caller.declaringClass, "a.A");
  EXPECT_EQ(records[0].line, 2);
  EXPECT_EQ(records[1].line, 9);
  EXPECT_EQ(records[2].caller.declaringClass, "b.B");
}

TEST(RawRecordStore, ConcurrentAdds) {
  RawRecordStore store;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&store, t] {
      for (int i = 0; i < 100; ++i) {
        store.add(methodCall(testutil::unit("C" + std::to_string(t)), TargetInfo::of("T", "m", "()V"), i));
        store.add(methodCall(testutil::unit("Shared"), TargetInfo::of("T", "m", "()V"), i));
      }
    });
  }
  for (auto& th : threads) { th.join(); }
  EXPECT_EQ(store.size(), 500u);
}

TEST(RawAccessRecord, Rendering) {
  const auto rec = fieldAccess(testutil::unit("A", "run", "()V"), TargetInfo::of("B", "n", "I"), 4, AccessType::Set);
  EXPECT_EQ(rec.toString(), "field-access{accessType=set, caller=A.run()V, target={owner='B', name='n', desc='I'}, lineNumber=4}");
}
