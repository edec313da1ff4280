/***
 * Name: Analyzer literal visitors
 * Purpose: Literal expressions evaluate to their literal types.
 */
#include "analyzer/Analyzer.h"

namespace tyflow::analyzer {

void Analyzer::visit(const ast::StringLiteral& node) {
  out_ = ty::Ty::stringLiteral(types_.arena().intern(node.value));
}

void Analyzer::visit(const ast::NumberLiteral& node) { out_ = ty::Ty::numericLiteral(node.value); }

void Analyzer::visit(const ast::BoolLiteral& node) { out_ = ty::Ty::booleanLiteral(node.value); }

void Analyzer::visit(const ast::NullLiteral&) { out_ = ty::Ty::of(ty::TyKind::Null); }

} // namespace tyflow::analyzer
