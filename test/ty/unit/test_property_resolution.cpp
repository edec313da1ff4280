/***
 * Name: test_property_resolution
 * Purpose: Built-in per-kind property answers.
 */
#include <gtest/gtest.h>
#include "ty/Shapes.h"
#include "ty/TypeArena.h"
#include "ty/TypeContext.h"

using namespace tyflow::ty;

namespace {

struct PropertyTest : ::testing::Test {
  TypeArena arena;
  TypeContext types{arena};

  Ty get(const Ty& receiver, const char* key) { return types.getProperty(receiver, PropertyKey::named(key)); }
};

} // namespace

TEST_F(PropertyTest, SentinelsPropagate) {
  EXPECT_EQ(get(Ty::of(TyKind::Any), "x"), Ty::of(TyKind::Any));
  EXPECT_EQ(get(Ty::of(TyKind::Unknown), "x"), Ty::of(TyKind::Unknown));
  EXPECT_EQ(get(Ty::of(TyKind::Error), "x"), Ty::of(TyKind::Error));
  EXPECT_EQ(get(Ty::of(TyKind::Never), "x"), Ty::of(TyKind::Never));
}

TEST_F(PropertyTest, NullishReceiversYieldNever) {
  EXPECT_EQ(get(Ty::of(TyKind::Null), "x"), Ty::of(TyKind::Never));
  EXPECT_EQ(get(Ty::of(TyKind::Undefined), "x"), Ty::of(TyKind::Never));
  EXPECT_EQ(get(Ty::of(TyKind::Void), "x"), Ty::of(TyKind::Never));
}

TEST_F(PropertyTest, StringLength) {
  EXPECT_EQ(get(Ty::of(TyKind::String), "length"), Ty::of(TyKind::Number));
  EXPECT_EQ(get(Ty::stringLiteral(arena.intern("hello")), "length"), Ty::numericLiteral(5));
  // Lengths count UTF-16 code units, not bytes.
  EXPECT_EQ(get(Ty::stringLiteral(arena.intern("\xC3\xA9")), "length"), Ty::numericLiteral(1));
  EXPECT_EQ(get(Ty::stringLiteral(arena.intern("\xE2\x82\xAC!")), "length"), Ty::numericLiteral(2));
  EXPECT_EQ(get(Ty::stringLiteral(arena.intern("\xF0\x9F\x98\x80")), "length"), Ty::numericLiteral(2));
  EXPECT_EQ(get(Ty::stringLiteral(arena.intern("")), "length"), Ty::numericLiteral(0));
  // Not valid UTF-8: the exact length is unknown.
  EXPECT_EQ(get(Ty::stringLiteral(arena.intern("\xC3")), "length"), Ty::of(TyKind::Number));
  EXPECT_EQ(get(Ty::stringLiteral(arena.intern("\xED\xA0\x80")), "length"), Ty::of(TyKind::Number));
  EXPECT_EQ(get(Ty::of(TyKind::String), "foo"), Ty::of(TyKind::Unknown));
}

TEST_F(PropertyTest, RecordSlotsAndMissingKeys) {
  auto* r = arena.alloc<RecordType>();
  r->properties.push_back(PropertySlot{PropertyKey::named("a"), Ty::of(TyKind::String), false});
  r->properties.push_back(PropertySlot{PropertyKey::named("b"), Ty::of(TyKind::Number), true});
  const Ty rec = Ty::node(r);
  EXPECT_EQ(get(rec, "a"), Ty::of(TyKind::String));
  EXPECT_EQ(get(rec, "b"), types.intoUnion({Ty::of(TyKind::Undefined), Ty::of(TyKind::Number)}));
  EXPECT_EQ(get(rec, "c"), Ty::of(TyKind::Undefined));
}

TEST_F(PropertyTest, InterfaceAndNamespaceMissingKeysAreUnknown) {
  auto* i = arena.alloc<InterfaceType>("Point");
  i->properties.push_back(PropertySlot{PropertyKey::named("x"), Ty::of(TyKind::Number), false});
  auto* ns = arena.alloc<NamespaceType>("Util");
  ns->members.push_back(PropertySlot{PropertyKey::named("version"), Ty::of(TyKind::String), false});
  EXPECT_EQ(get(Ty::node(i), "x"), Ty::of(TyKind::Number));
  EXPECT_EQ(get(Ty::node(i), "y"), Ty::of(TyKind::Unknown));
  EXPECT_EQ(get(Ty::node(ns), "version"), Ty::of(TyKind::String));
  EXPECT_EQ(get(Ty::node(ns), "missing"), Ty::of(TyKind::Unknown));
}

TEST_F(PropertyTest, IntersectionNeedsExactlyOneDefiningMember) {
  auto* a = arena.alloc<RecordType>();
  a->properties.push_back(PropertySlot{PropertyKey::named("x"), Ty::of(TyKind::String), false});
  auto* b = arena.alloc<InterfaceType>("B");
  b->properties.push_back(PropertySlot{PropertyKey::named("y"), Ty::of(TyKind::Number), false});
  b->properties.push_back(PropertySlot{PropertyKey::named("x"), Ty::of(TyKind::Boolean), false});
  auto* c = arena.alloc<RecordType>();
  c->properties.push_back(PropertySlot{PropertyKey::named("z"), Ty::of(TyKind::Null), false});
  auto* both = arena.alloc<IntersectionType>();
  both->members = {Ty::node(a), Ty::node(b), Ty::node(c)};
  const Ty inter = Ty::node(both);
  EXPECT_EQ(get(inter, "y"), Ty::of(TyKind::Number));
  EXPECT_EQ(get(inter, "z"), Ty::of(TyKind::Null));
  EXPECT_EQ(get(inter, "x"), Ty::of(TyKind::Unknown));
  EXPECT_EQ(get(inter, "w"), Ty::of(TyKind::Unknown));
}

TEST_F(PropertyTest, CallableLengthCountsRequiredParams) {
  auto* fn = arena.alloc<CallableType>(TyKind::Constructor);
  fn->params.push_back(ParamSlot{"a", Ty::of(TyKind::String), false});
  fn->params.push_back(ParamSlot{"b", Ty::of(TyKind::String), false});
  fn->params.push_back(ParamSlot{"c", Ty::of(TyKind::String), true});
  EXPECT_EQ(get(Ty::node(fn), "length"), Ty::numericLiteral(2));
  EXPECT_EQ(get(Ty::node(fn), "name"), Ty::of(TyKind::String));
  EXPECT_EQ(get(Ty::node(fn), "call"), Ty::of(TyKind::Unknown));
}

TEST_F(PropertyTest, GenericAndIntrinsicGiveUp) {
  EXPECT_EQ(get(Ty::node(arena.alloc<GenericType>("G")), "x"), Ty::of(TyKind::Error));
  EXPECT_EQ(get(Ty::node(arena.alloc<IntrinsicType>("Capitalize")), "x"), Ty::of(TyKind::Error));
}

TEST_F(PropertyTest, UnionReadDropsNullishMembers) {
  const Ty u = types.intoUnion({Ty::stringLiteral(arena.intern("ab")), Ty::of(TyKind::Undefined)});
  EXPECT_EQ(get(u, "length"), Ty::numericLiteral(2));
}

TEST_F(PropertyTest, SymbolKeysOnlyMatchSymbolSlots) {
  const SymbolId sym = arena.newSymbol();
  auto* r = arena.alloc<RecordType>();
  r->properties.push_back(PropertySlot{PropertyKey::ofSymbol(sym), Ty::of(TyKind::BigInt), false});
  EXPECT_EQ(types.getProperty(Ty::node(r), PropertyKey::ofSymbol(sym)), Ty::of(TyKind::BigInt));
  EXPECT_EQ(types.getProperty(Ty::node(r), PropertyKey::ofSymbol(arena.newSymbol())), Ty::of(TyKind::Undefined));
}
