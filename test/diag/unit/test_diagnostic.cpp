/***
 * Name: test_diagnostic
 * Purpose: Diagnostic rendering with and without colour, and the environment colour switch.
 */
#include <gtest/gtest.h>
#include <cstdlib>
#include <sstream>

#include "archlink/diag/Diagnostic.h"

using namespace archlink::diag;

TEST(Diagnostic, PlainRendering) {
  std::ostringstream out;
  printDiagnostic(out, warning("missing dependency 'x.Y'", "a.B.run()V", 12), false);
  EXPECT_EQ(out.str(), "a.B.run()V:12: warning: missing dependency 'x.Y'\n");

  std::ostringstream noLine;
  printDiagnostic(noLine, warning("msg", "a.B"), false);
  EXPECT_EQ(noLine.str(), "a.B: warning: msg\n");

  std::ostringstream bare;
  Diagnostic err;
  err.severity = Severity::Error;
  err.message = "boom";
  printDiagnostic(bare, err, false);
  EXPECT_EQ(bare.str(), "error: boom\n");
}

TEST(Diagnostic, ColouredRendering) {
  std::ostringstream out;
  printDiagnostic(out, warning("msg", "a.B", 3), true);
  EXPECT_EQ(out.str(), "\033[1ma.B:3: \033[0m\033[33mwarning: \033[0mmsg\n");
}

TEST(Diagnostic, EnvColour) {
  setenv("ARCHLINK_COLOR", "YES", 1);
  EXPECT_TRUE(useEnvColor());
  setenv("ARCHLINK_COLOR", "0", 1);
  EXPECT_FALSE(useEnvColor());
  unsetenv("ARCHLINK_COLOR");
  EXPECT_FALSE(useEnvColor());
}
