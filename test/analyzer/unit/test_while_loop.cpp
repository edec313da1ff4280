/***
 * Name: test_while_loop
 * Purpose: Zero-or-more iteration semantics of while statements.
 */
#include <gtest/gtest.h>
#include "analyzer/Analyzer.h"
#include "analyzer/ScopeGuard.h"
#include "ast/Nodes.h"
#include "observability/Metrics.h"
#include "ty/TypeArena.h"
#include "ty/TypeContext.h"
#include "ty/TypePrinter.h"
#include "tyflow/exceptions/invariant_error.h"

#include <memory>
#include <sstream>

using namespace tyflow;
using tyflow::ty::Ty;
using tyflow::ty::TyKind;

namespace {

struct WhileTest : ::testing::Test {
  ty::TypeArena arena;
  ty::TypeContext types{arena};
  std::vector<analyzer::Diagnostic> diags;
};

// while (x) { x = n; }
std::unique_ptr<ast::WhileStmt> loopAssigning(const char* target, const char* source) {
  auto body = std::make_unique<ast::BlockStmt>();
  body->body.push_back(std::make_unique<ast::AssignStmt>(target, std::make_unique<ast::Name>(source)));
  return std::make_unique<ast::WhileStmt>(std::make_unique<ast::Name>(target), std::move(body));
}

} // namespace

TEST_F(WhileTest, BodyMergesWithEntryState) {
  analyzer::Analyzer an(types, diags);
  an.declare("x", Ty::of(TyKind::String));
  an.declare("n", Ty::of(TyKind::Number));
  const auto loop = loopAssigning("x", "n");
  an.execWhileStatement(*loop);
  EXPECT_EQ(an.lookup("x"), types.intoUnion({Ty::of(TyKind::String), Ty::of(TyKind::Number)}));
  EXPECT_NE(an.lookup("x"), Ty::of(TyKind::Number));
  EXPECT_EQ(an.scopeDepth(), 1u);
  EXPECT_TRUE(diags.empty());
}

TEST_F(WhileTest, TraceShowsScopeNesting) {
  std::ostringstream trace;
  obs::Metrics metrics;
  analyzer::AnalyzerOptions opts;
  opts.trace = &trace;
  opts.metrics = &metrics;
  analyzer::Analyzer an(types, diags, opts);
  an.declare("x", Ty::of(TyKind::String));
  an.declare("n", Ty::of(TyKind::Number));
  const auto loop = loopAssigning("x", "n");
  an.execStatement(*loop);
  EXPECT_EQ(trace.str(),
            "push indeterminate depth=2\n"
            "pop indeterminate depth=1 merged=0\n"
            "push loop depth=2\n"
            "push normal depth=3\n"
            "pop normal depth=2 merged=1\n"
            "pop loop depth=1 merged=1\n");
  EXPECT_EQ(metrics.counter("analyzer.scopes.pushed"), 3u);
  EXPECT_EQ(metrics.counter("analyzer.scopes.merged_bindings"), 2u);
}

TEST_F(WhileTest, ReassignedObjectLiteralStaysSingleRecord) {
  // { a: { b: 1 } }
  auto literal = [] {
    auto inner = std::make_unique<ast::ObjectLiteral>();
    inner->fields.push_back(ast::ObjectField{"b", std::make_unique<ast::NumberLiteral>(1.0)});
    auto outer = std::make_unique<ast::ObjectLiteral>();
    outer->fields.push_back(ast::ObjectField{"a", std::move(inner)});
    return outer;
  };
  analyzer::Analyzer an(types, diags);
  ast::LetStmt init("x", literal());
  an.execStatement(init);

  auto body = std::make_unique<ast::BlockStmt>();
  body->body.push_back(std::make_unique<ast::AssignStmt>("x", literal()));
  ast::WhileStmt loop(std::make_unique<ast::BoolLiteral>(true), std::move(body));
  an.execWhileStatement(loop);

  const auto x = an.lookup("x");
  ASSERT_TRUE(x.has_value());
  EXPECT_EQ(x->kind(), TyKind::Record);
  EXPECT_EQ(ty::typeToString(*x), "{ a: { b: 1 } }");
  EXPECT_TRUE(diags.empty());
}

TEST_F(WhileTest, LoopLocalsDoNotEscape) {
  analyzer::Analyzer an(types, diags);
  auto body = std::make_unique<ast::BlockStmt>();
  body->body.push_back(std::make_unique<ast::LetStmt>("tmp", std::make_unique<ast::NumberLiteral>(1.0)));
  ast::WhileStmt loop(std::make_unique<ast::BoolLiteral>(true), std::move(body));
  an.execWhileStatement(loop);
  EXPECT_FALSE(an.lookup("tmp").has_value());
}

TEST_F(WhileTest, AssignmentInTestIsConditional) {
  analyzer::Analyzer an(types, diags);
  an.declare("x", Ty::of(TyKind::String));
  // while ((x = null)) {}
  ast::WhileStmt loop(std::make_unique<ast::NamedExpr>("x", std::make_unique<ast::NullLiteral>()),
                      std::make_unique<ast::BlockStmt>());
  an.execWhileStatement(loop);
  EXPECT_EQ(an.lookup("x"), types.intoUnion({Ty::of(TyKind::String), Ty::of(TyKind::Null)}));
}

namespace {

struct Exploding final : ty::PropertyResolver {
  Ty getProperty(const Ty&, const ty::PropertyKey&) override { throw exceptions::InvariantError("resolver failure"); }
};

} // namespace

TEST_F(WhileTest, AbruptExitDiscardsOpenFrames) {
  Exploding exploding;
  types.setPropertyResolver(&exploding);
  analyzer::Analyzer an(types, diags);
  an.declare("x", Ty::of(TyKind::String));
  an.declare("n", Ty::of(TyKind::Number));
  auto body = std::make_unique<ast::BlockStmt>();
  body->body.push_back(std::make_unique<ast::AssignStmt>("x", std::make_unique<ast::Name>("n")));
  body->body.push_back(std::make_unique<ast::ExprStmt>(
      std::make_unique<ast::Attribute>(std::make_unique<ast::Name>("x"), "size")));
  ast::WhileStmt loop(std::make_unique<ast::BoolLiteral>(true), std::move(body));
  EXPECT_THROW(an.execWhileStatement(loop), exceptions::InvariantError);
  EXPECT_EQ(an.scopeDepth(), 1u);
  EXPECT_EQ(an.lookup("x"), Ty::of(TyKind::String));
}

TEST_F(WhileTest, ScopeGuardPopsOnNormalExit) {
  analyzer::Analyzer an(types, diags);
  an.declare("x", Ty::of(TyKind::String));
  {
    analyzer::ScopeGuard guard(an, analyzer::ScopeKind::Indeterminate);
    EXPECT_EQ(an.scopeDepth(), 2u);
    an.execStatement(ast::AssignStmt("x", std::make_unique<ast::NumberLiteral>(4.0)));
  }
  EXPECT_EQ(an.scopeDepth(), 1u);
  EXPECT_EQ(an.lookup("x"), types.intoUnion({Ty::of(TyKind::String), Ty::numericLiteral(4.0)}));
}

TEST_F(WhileTest, PoppingRootScopeThrows) {
  analyzer::Analyzer an(types, diags);
  EXPECT_THROW(an.popScope(), exceptions::InvariantError);
}
