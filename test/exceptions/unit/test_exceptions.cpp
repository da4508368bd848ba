/***
 * Name: test_exceptions
 * Purpose: Marker exceptions carry their message and are caught as ArchlinkException.
 */
#include <gtest/gtest.h>
#include <string>

#include "archlink/exceptions/missing_dependency_error.h"
#include "archlink/exceptions/model_inconsistency_error.h"

using namespace archlink::exceptions;

TEST(Exceptions, MissingDependencyError) {
  try {
    throw MissingDependencyError("no class file for lib.Gone");
  } catch (const ArchlinkException& e) {
    EXPECT_EQ(std::string(e.what()), "no class file for lib.Gone");
  }
}

TEST(Exceptions, ModelInconsistencyError) {
  EXPECT_THROW(throw ModelInconsistencyError("caller missing"), ArchlinkException);
  const ModelInconsistencyError err("caller missing");
  EXPECT_EQ(std::string(err.what()), "caller missing");
}
