/***
 * Name: test_statements
 * Purpose: Declarations, assignments, branches and expression typing in the analyzer.
 */
#include <gtest/gtest.h>
#include "analyzer/Analyzer.h"
#include "ast/Nodes.h"
#include "observability/Metrics.h"
#include "ty/Shapes.h"
#include "ty/TypeArena.h"
#include "ty/TypeContext.h"

#include <memory>

using namespace tyflow;
using tyflow::ty::Ty;
using tyflow::ty::TyKind;

namespace {

struct StatementsTest : ::testing::Test {
  ty::TypeArena arena;
  ty::TypeContext types{arena};
  std::vector<analyzer::Diagnostic> diags;
};

std::unique_ptr<ast::BlockStmt> blockAssigning(const char* target, std::unique_ptr<ast::Expr> value) {
  auto block = std::make_unique<ast::BlockStmt>();
  block->body.push_back(std::make_unique<ast::AssignStmt>(target, std::move(value)));
  return block;
}

} // namespace

TEST_F(StatementsTest, LetUsesInitializerThenAnnotation) {
  analyzer::Analyzer an(types, diags);
  an.execStatement(ast::LetStmt("a", std::make_unique<ast::StringLiteral>("hi")));
  EXPECT_EQ(an.lookup("a"), Ty::stringLiteral("hi"));

  ast::LetStmt annotated("b", nullptr);
  annotated.annotation = Ty::of(TyKind::Number);
  annotated.optional = true;
  an.execStatement(annotated);
  EXPECT_EQ(an.lookup("b"), types.intoUnion({Ty::of(TyKind::Undefined), Ty::of(TyKind::Number)}));

  an.execStatement(ast::LetStmt("c", nullptr));
  EXPECT_EQ(an.lookup("c"), Ty::of(TyKind::Undefined));
  EXPECT_TRUE(diags.empty());
}

TEST_F(StatementsTest, IfBranchesJoinConservatively) {
  analyzer::Analyzer an(types, diags);
  an.declare("x", Ty::of(TyKind::String));
  an.declare("c", Ty::of(TyKind::Boolean));
  ast::IfStmt branch(std::make_unique<ast::Name>("c"), blockAssigning("x", std::make_unique<ast::NumberLiteral>(1.0)),
                     blockAssigning("x", std::make_unique<ast::NullLiteral>()));
  an.execIfStatement(branch);
  EXPECT_EQ(an.lookup("x"),
            types.intoUnion({Ty::of(TyKind::String), Ty::numericLiteral(1.0), Ty::of(TyKind::Null)}));
  EXPECT_EQ(an.scopeDepth(), 1u);
}

TEST_F(StatementsTest, IfWithoutElseKeepsEntryState) {
  analyzer::Analyzer an(types, diags);
  an.declare("x", Ty::of(TyKind::Undefined));
  ast::IfStmt branch(std::make_unique<ast::BoolLiteral>(true),
                     blockAssigning("x", std::make_unique<ast::StringLiteral>("set")));
  an.execStatement(branch);
  EXPECT_EQ(an.lookup("x"), types.intoUnion({Ty::of(TyKind::Undefined), Ty::stringLiteral("set")}));
}

TEST_F(StatementsTest, BlockAssignmentIsCertain) {
  analyzer::Analyzer an(types, diags);
  an.declare("x", Ty::of(TyKind::String));
  const auto block = blockAssigning("x", std::make_unique<ast::BoolLiteral>(false));
  an.execBlockStatement(*block);
  EXPECT_EQ(an.lookup("x"), Ty::booleanLiteral(false));
}

TEST_F(StatementsTest, UndeclaredNamesAreDiagnosed) {
  obs::Metrics metrics;
  analyzer::AnalyzerOptions opts;
  opts.metrics = &metrics;
  analyzer::Analyzer an(types, diags, opts);
  ast::Name ghost("ghost");
  ghost.loc.line = 3;
  ghost.loc.col = 7;
  ghost.loc.file = "main.ts";
  EXPECT_EQ(an.execExpression(ghost), Ty::of(TyKind::Unknown));
  an.execStatement(ast::AssignStmt("other", std::make_unique<ast::NumberLiteral>(2.0)));
  ASSERT_EQ(diags.size(), 2u);
  EXPECT_EQ(diags[0].message, "read of undeclared name: ghost");
  EXPECT_EQ(diags[0].loc.file, "main.ts");
  EXPECT_EQ(diags[0].loc.line, 3);
  EXPECT_EQ(diags[0].loc.col, 7);
  EXPECT_EQ(diags[1].message, "assignment to undeclared name: other");
  EXPECT_EQ(an.lookup("other"), Ty::numericLiteral(2.0));
  EXPECT_EQ(metrics.counter("analyzer.diagnostics"), 2u);
}

TEST_F(StatementsTest, UndefinedIdentifierIsTheUndefinedType) {
  analyzer::Analyzer an(types, diags);
  EXPECT_EQ(an.execExpression(ast::Name("undefined")), Ty::of(TyKind::Undefined));
  EXPECT_TRUE(diags.empty());
}

TEST_F(StatementsTest, NullishPropertyReadsAreDiagnosed) {
  analyzer::Analyzer an(types, diags);
  an.declare("n", types.intoUnion({Ty::of(TyKind::Null), Ty::of(TyKind::Undefined)}));
  an.declare("s", types.intoUnion({Ty::of(TyKind::String), Ty::of(TyKind::Undefined)}));
  EXPECT_EQ(an.execExpression(ast::Attribute(std::make_unique<ast::Name>("n"), "length")), Ty::of(TyKind::Never));
  EXPECT_EQ(an.execExpression(ast::Attribute(std::make_unique<ast::Name>("s"), "length")), Ty::of(TyKind::Number));
  ASSERT_EQ(diags.size(), 1u);
  EXPECT_EQ(diags[0].message, "property 'length' read on a value that is always null or undefined");
}

TEST_F(StatementsTest, NullishReadDiagnosticCanBeDisabled) {
  analyzer::AnalyzerOptions opts;
  opts.reportNullishReads = false;
  analyzer::Analyzer an(types, diags, opts);
  an.execExpression(ast::Attribute(std::make_unique<ast::NullLiteral>(), "x"));
  EXPECT_TRUE(diags.empty());
}

TEST_F(StatementsTest, ObjectLiteralBuildsRecord) {
  analyzer::Analyzer an(types, diags);
  ast::ObjectLiteral obj;
  obj.fields.push_back(ast::ObjectField{"name", std::make_unique<ast::StringLiteral>("tyflow")});
  obj.fields.push_back(ast::ObjectField{"ok", std::make_unique<ast::BoolLiteral>(true)});
  const Ty t = an.execExpression(obj);
  ASSERT_TRUE(t.is(TyKind::Record));
  EXPECT_EQ(types.getProperty(t, ty::PropertyKey::named("ok")), Ty::booleanLiteral(true));
  EXPECT_EQ(types.getProperty(t, ty::PropertyKey::named("missing")), Ty::of(TyKind::Undefined));
  ASSERT_TRUE(obj.type().has_value());
  EXPECT_TRUE(obj.type()->identical(t));
  EXPECT_EQ(obj.fields[0].value->type(), Ty::stringLiteral("tyflow"));
}

TEST_F(StatementsTest, NamedExpressionAssignsAndYields) {
  analyzer::Analyzer an(types, diags);
  an.declare("x", Ty::of(TyKind::String));
  const Ty t = an.execExpression(ast::NamedExpr("x", std::make_unique<ast::NumberLiteral>(9.0)));
  EXPECT_EQ(t, Ty::numericLiteral(9.0));
  EXPECT_EQ(an.lookup("x"), Ty::numericLiteral(9.0));
}

TEST_F(StatementsTest, ModuleRunsStatementsInOrder) {
  analyzer::Analyzer an(types, diags);
  ast::Module mod;
  mod.body.push_back(std::make_unique<ast::LetStmt>("x", std::make_unique<ast::StringLiteral>("a")));
  mod.body.push_back(std::make_unique<ast::LetStmt>("y", std::make_unique<ast::Name>("x")));
  mod.body.push_back(std::make_unique<ast::AssignStmt>("x", std::make_unique<ast::NullLiteral>()));
  an.execModule(mod);
  EXPECT_EQ(an.lookup("x"), Ty::of(TyKind::Null));
  EXPECT_EQ(an.lookup("y"), Ty::stringLiteral("a"));
}
