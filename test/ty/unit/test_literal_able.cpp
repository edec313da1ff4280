/***
 * Name: test_literal_able
 * Purpose: Verify the Vacant -> Literals -> Any widening lattice.
 */
#include <gtest/gtest.h>
#include "ty/LiteralAble.h"

#include <limits>
#include <string_view>
#include <vector>

using namespace tyflow::ty;

static std::vector<Ty> expand(const LiteralAble<std::string_view>& slot) {
  std::vector<Ty> out;
  slot.forEach(Ty::of(TyKind::String), [](std::string_view s) { return Ty::stringLiteral(s); },
               [&](const Ty& t) { out.push_back(t); });
  return out;
}

TEST(LiteralAble, VacantExpandsToNothing) {
  LiteralAble<std::string_view> slot;
  EXPECT_TRUE(slot.isVacant());
  EXPECT_TRUE(expand(slot).empty());
}

TEST(LiteralAble, RepeatedAddIsIdempotent) {
  LiteralAble<std::string_view> once;
  once.add("a");
  LiteralAble<std::string_view> many;
  for (int i = 0; i < 5; ++i) many.add("a");
  EXPECT_TRUE(once.sameMembers(many));
  ASSERT_EQ(many.literals().size(), 1u);
  EXPECT_EQ(expand(many), std::vector<Ty>{Ty::stringLiteral("a")});
}

TEST(LiteralAble, DistinctLiteralsKeepFirstInsertionOrder) {
  LiteralAble<std::string_view> slot;
  slot.add("b");
  slot.add("a");
  slot.add("b");
  const auto members = expand(slot);
  ASSERT_EQ(members.size(), 2u);
  EXPECT_EQ(members[0], Ty::stringLiteral("b"));
  EXPECT_EQ(members[1], Ty::stringLiteral("a"));
}

TEST(LiteralAble, AnyAbsorbsLaterLiterals) {
  LiteralAble<std::string_view> slot;
  slot.add("a");
  slot.setAny();
  slot.add("b");
  slot.add("c");
  EXPECT_TRUE(slot.isAny());
  EXPECT_TRUE(slot.literals().empty());
  EXPECT_EQ(expand(slot), std::vector<Ty>{Ty::of(TyKind::String)});
}

TEST(LiteralAble, NumbersCompareBitwiseSoNaNDeduplicates) {
  LiteralAble<NumberValue> slot;
  slot.add(NumberValue{std::numeric_limits<double>::quiet_NaN()});
  slot.add(NumberValue{-std::numeric_limits<double>::quiet_NaN()});
  slot.add(NumberValue{1.0});
  EXPECT_EQ(slot.literals().size(), 2u);
}
