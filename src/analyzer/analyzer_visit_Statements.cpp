/***
 * Name: Analyzer statement visitors
 * Purpose: Module, expression statements, assignments and `let` declarations.
 */
#include "analyzer/Analyzer.h"

namespace tyflow::analyzer {

void Analyzer::visit(const ast::Module& node) { execModule(node); }

void Analyzer::visit(const ast::ExprStmt& node) {
  if (node.value) execExpression(*node.value);
}

/*** Name: Analyzer::visit(AssignStmt) */
void Analyzer::visit(const ast::AssignStmt& node) {
  const ty::Ty value = node.value ? execExpression(*node.value) : ty::Ty::of(ty::TyKind::Undefined);
  assign(node.target, value, &node);
}

/***
 * Name: Analyzer::visit(LetStmt)
 * Purpose: Declare in the current frame.
 * Theory of Operation:
 *   An initializer narrows the binding to its own type. Otherwise the
 *   annotation (widened with undefined when optional) applies, and a bare
 *   `let x` starts out undefined.
 */
void Analyzer::visit(const ast::LetStmt& node) {
  ty::Ty value = ty::Ty::of(ty::TyKind::Undefined);
  if (node.init) {
    value = execExpression(*node.init);
  } else if (node.annotation) {
    value = types_.getOptionalType(node.optional, *node.annotation);
  }
  scopes_.declare(node.name, value);
}

} // namespace tyflow::analyzer
