/***
 * Name: Analyzer::visit(Name)
 * Purpose: Resolve a name to its narrowed type at the current program point.
 */
#include "analyzer/Analyzer.h"

namespace tyflow::analyzer {

void Analyzer::visit(const ast::Name& node) {
  if (auto bound = scopes_.lookup(node.id)) {
    out_ = *bound;
    return;
  }
  if (node.isUndefinedKeyword()) {
    out_ = ty::Ty::of(ty::TyKind::Undefined);
    return;
  }
  report("read of undeclared name: " + node.id, &node);
  out_ = ty::Ty::of(ty::TyKind::Unknown);
}

} // namespace tyflow::analyzer
