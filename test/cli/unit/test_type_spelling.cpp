/***
 * Name: test_type_spelling
 * Purpose: Command-line type spellings map onto the expected Ty values.
 */
#include <gtest/gtest.h>
#include "ty/TypeArena.h"
#include "tyflow/exceptions/config_error.h"
#include "tyflow/support/type_spelling.h"

using namespace tyflow;
using namespace tyflow::support;
using tyflow::ty::Ty;
using tyflow::ty::TyKind;

TEST(TypeSpelling, Keywords) {
  ty::TypeArena arena;
  EXPECT_EQ(ParseTypeSpelling("string", arena), Ty::of(TyKind::String));
  EXPECT_EQ(ParseTypeSpelling(" null ", arena), Ty::of(TyKind::Null));
  EXPECT_EQ(ParseTypeSpelling("never", arena), Ty::of(TyKind::Never));
  EXPECT_EQ(ParseTypeSpelling("unknown", arena), Ty::of(TyKind::Unknown));
}

TEST(TypeSpelling, Literals) {
  ty::TypeArena arena;
  EXPECT_EQ(ParseTypeSpelling("'abc'", arena), Ty::stringLiteral("abc"));
  EXPECT_EQ(ParseTypeSpelling("\"\"", arena), Ty::stringLiteral(""));
  EXPECT_EQ(ParseTypeSpelling("42", arena), Ty::numericLiteral(42));
  EXPECT_EQ(ParseTypeSpelling("-1.5", arena), Ty::numericLiteral(-1.5));
  EXPECT_EQ(ParseTypeSpelling("7n", arena), Ty::bigintLiteral("7"));
  EXPECT_EQ(ParseTypeSpelling("-12n", arena), Ty::bigintLiteral("-12"));
  EXPECT_EQ(ParseTypeSpelling("true", arena), Ty::booleanLiteral(true));
}

TEST(TypeSpelling, BigIntLiteralsAreCanonical) {
  ty::TypeArena arena;
  EXPECT_EQ(ParseTypeSpelling("07n", arena), Ty::bigintLiteral("7"));
  EXPECT_EQ(ParseTypeSpelling("-0012n", arena), Ty::bigintLiteral("-12"));
  EXPECT_EQ(ParseTypeSpelling("-0n", arena), Ty::bigintLiteral("0"));
  EXPECT_EQ(ParseTypeSpelling("000n", arena), Ty::bigintLiteral("0"));
}

TEST(TypeSpelling, RejectsUnknownText) {
  ty::TypeArena arena;
  EXPECT_THROW(ParseTypeSpelling("strnig", arena), exceptions::ConfigError);
  EXPECT_THROW(ParseTypeSpelling("", arena), exceptions::ConfigError);
  EXPECT_THROW(ParseTypeSpelling("'open", arena), exceptions::ConfigError);
  EXPECT_THROW(ParseTypeSpelling("1.5n", arena), exceptions::ConfigError);
  EXPECT_THROW(ParseTypeSpelling("12abc", arena), exceptions::ConfigError);
}

TEST(TypeSpelling, ListSplitsOnBarOutsideQuotes) {
  ty::TypeArena arena;
  const auto members = ParseTypeList({"string|null", "'a|b'", "1"}, arena);
  ASSERT_EQ(members.size(), 4u);
  EXPECT_EQ(members[0], Ty::of(TyKind::String));
  EXPECT_EQ(members[1], Ty::of(TyKind::Null));
  EXPECT_EQ(members[2], Ty::stringLiteral("a|b"));
  EXPECT_EQ(members[3], Ty::numericLiteral(1));
}

TEST(TypeSpelling, EmptyAlternativeIsRejected) {
  ty::TypeArena arena;
  EXPECT_THROW(ParseTypeList({"string|"}, arena), exceptions::ConfigError);
}
