/***
 * Name: test_exceptions
 * Purpose: Verify exception categories and the labels main() prints.
 */
#include <gtest/gtest.h>
#include "tyflow/exceptions/config_error.h"
#include "tyflow/exceptions/invariant_error.h"

#include <string>

using namespace tyflow::exceptions;

TEST(Exceptions, ConfigErrorIsUserFacing) {
  const ConfigError error("unknown type 'strin'");
  EXPECT_EQ(error.category(), TyflowException::Category::Config);
  EXPECT_EQ(error.label(), "error");
  EXPECT_EQ(std::string(error.what()), "unknown type 'strin'");
}

TEST(Exceptions, InvariantErrorIsInternal) {
  const InvariantError error("scope stack underflow");
  EXPECT_EQ(error.category(), TyflowException::Category::Invariant);
  EXPECT_EQ(error.label(), "internal error");
}

TEST(Exceptions, CatchableAsBase) {
  try {
    throw InvariantError("boom");
  } catch (const TyflowException& ex) {
    EXPECT_EQ(std::string(ex.what()), "boom");
    return;
  }
  FAIL() << "expected TyflowException";
}
