/***
 * Name: Analyzer::execWhileStatement
 * Purpose: Evaluate `while (test) body` with zero-or-more iteration semantics.
 * Theory of Operation:
 *   The test may or may not be reached with any given state, so it runs in
 *   an Indeterminate scope. The body runs in a Loop scope whose pop folds
 *   `before | after-one-iteration` into the parent.
 */
#include "analyzer/Analyzer.h"
#include "analyzer/ScopeGuard.h"

namespace tyflow::analyzer {

void Analyzer::execWhileStatement(const ast::WhileStmt& node) {
  {
    ScopeGuard test(*this, ScopeKind::Indeterminate);
    if (node.cond) execExpression(*node.cond);
  }
  // TODO: thread truthiness narrowing of the test into the body scope.
  ScopeGuard body(*this, ScopeKind::Loop);
  if (node.body) execStatement(*node.body);
}

void Analyzer::visit(const ast::WhileStmt& node) { execWhileStatement(node); }

} // namespace tyflow::analyzer
