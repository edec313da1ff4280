/***
 * Name: Analyzer::visit(NamedExpr)
 * Purpose: `(target = value)` assigns and yields the assigned type.
 */
#include "analyzer/Analyzer.h"

namespace tyflow::analyzer {

void Analyzer::visit(const ast::NamedExpr& node) {
  const ty::Ty value = node.value ? execExpression(*node.value) : ty::Ty::of(ty::TyKind::Undefined);
  assign(node.target, value, &node);
  out_ = value;
}

} // namespace tyflow::analyzer
