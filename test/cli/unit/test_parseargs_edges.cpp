/***
 * Name: test_parseargs_edges
 * Purpose: Exercise CLI parsing edge cases.
 */
#include <gtest/gtest.h>
#include "archlink/cli/ParseArgs.h"

using namespace archlink::cli;

TEST(CLI_Edges, DoubleDashTreatsAllFollowingAsPositional) {
  const char* argv[] = {"archlink", "--", "-j", "--metrics", "x.dump"};
  Options o; ASSERT_TRUE(ParseArgs(5, const_cast<char**>(argv), o));
  ASSERT_EQ(o.inputs.size(), 3u);
  EXPECT_EQ(o.inputs[0], "-j");
  EXPECT_EQ(o.inputs[1], "--metrics");
  EXPECT_EQ(o.inputs[2], "x.dump");
  EXPECT_FALSE(o.metrics);
  EXPECT_EQ(o.jobs, 1u);
}

TEST(CLI_Edges, LastJobsFlagWins) {
  const char* argv[] = {"archlink", "-j", "2", "--jobs=6", "a.dump"};
  Options o; ASSERT_TRUE(ParseArgs(5, const_cast<char**>(argv), o));
  EXPECT_EQ(o.jobs, 6u);
}

TEST(CLI_Edges, CallerDescriptorMayContainHashFreeTypes) {
  const char* argv[] = {"archlink", "--caller=a.B#<init>#(Ljava/lang/String;I)V", "a.dump"};
  Options o; ASSERT_TRUE(ParseArgs(3, const_cast<char**>(argv), o));
  EXPECT_EQ(o.caller->name, "<init>");
  EXPECT_EQ(o.caller->descriptor, "(Ljava/lang/String;I)V");
}

TEST(CLI_Edges, LoneDashIsPositional) {
  const char* argv[] = {"archlink", "-"};
  Options o; ASSERT_TRUE(ParseArgs(2, const_cast<char**>(argv), o));
  ASSERT_EQ(o.inputs.size(), 1u);
  EXPECT_EQ(o.inputs[0], "-");
}
