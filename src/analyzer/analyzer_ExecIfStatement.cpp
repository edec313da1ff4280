/***
 * Name: Analyzer::execIfStatement
 * Purpose: Evaluate `if (test) consequent [else alternate]`.
 * Theory of Operation:
 *   The test always runs, so it is evaluated in the current scope. Each
 *   branch gets its own Indeterminate scope; bindings written by both
 *   branches end up as `before | then | else`, which over-approximates the
 *   exact `then | else` join.
 */
#include "analyzer/Analyzer.h"
#include "analyzer/ScopeGuard.h"

namespace tyflow::analyzer {

void Analyzer::execIfStatement(const ast::IfStmt& node) {
  if (node.cond) execExpression(*node.cond);
  if (node.consequent) {
    ScopeGuard branch(*this, ScopeKind::Indeterminate);
    execStatement(*node.consequent);
  }
  if (node.alternate) {
    ScopeGuard branch(*this, ScopeKind::Indeterminate);
    execStatement(*node.alternate);
  }
}

void Analyzer::visit(const ast::IfStmt& node) { execIfStatement(node); }

} // namespace tyflow::analyzer
