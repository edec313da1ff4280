/***
 * Name: Analyzer::execBlockStatement
 * Purpose: Evaluate a `{ ... }` block in a Normal scope.
 */
#include "analyzer/Analyzer.h"
#include "analyzer/ScopeGuard.h"

namespace tyflow::analyzer {

void Analyzer::execBlockStatement(const ast::BlockStmt& node) {
  ScopeGuard block(*this, ScopeKind::Normal);
  for (const auto& stmt : node.body) {
    if (stmt) execStatement(*stmt);
  }
}

void Analyzer::visit(const ast::BlockStmt& node) { execBlockStatement(node); }

} // namespace tyflow::analyzer
