/***
 * Name: Analyzer::visit(Attribute)
 * Purpose: Type a property read `value.attr`.
 */
#include "analyzer/Analyzer.h"

namespace tyflow::analyzer {

namespace {

bool isNullish(const ty::Ty& t) {
  switch (t.kind()) {
    case ty::TyKind::Null:
    case ty::TyKind::Undefined:
    case ty::TyKind::Void:
      return true;
    case ty::TyKind::Union: {
      bool all = true;
      t.as<ty::UnionType>().forEach([&](const ty::Ty& m) { all = all && isNullish(m); });
      return all;
    }
    default:
      return false;
  }
}

} // namespace

void Analyzer::visit(const ast::Attribute& node) {
  const ty::Ty receiver = node.value ? execExpression(*node.value) : ty::Ty::of(ty::TyKind::Undefined);
  if (options_.reportNullishReads && isNullish(receiver)) {
    report("property '" + node.attr + "' read on a value that is always null or undefined", &node);
  }
  out_ = types_.getProperty(receiver, ty::PropertyKey::named(node.attr));
}

} // namespace tyflow::analyzer
