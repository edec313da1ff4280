/***
 * Name: Analyzer::visit(ObjectLiteral)
 * Purpose: Allocate a Record shape whose slots carry the field value types.
 */
#include "analyzer/Analyzer.h"
#include "ty/Shapes.h"

namespace tyflow::analyzer {

void Analyzer::visit(const ast::ObjectLiteral& node) {
  std::vector<ty::PropertySlot> slots;
  slots.reserve(node.fields.size());
  for (const auto& field : node.fields) {
    const ty::Ty value = field.value ? execExpression(*field.value) : ty::Ty::of(ty::TyKind::Undefined);
    const auto key = ty::PropertyKey::named(field.key);
    bool replaced = false;
    for (auto& slot : slots) {
      if (slot.key == key) { slot.type = value; replaced = true; break; }
    }
    if (!replaced) slots.push_back(ty::PropertySlot{key, value, false});
  }
  auto* record = types_.arena().alloc<ty::RecordType>();
  record->properties = std::move(slots);
  out_ = ty::Ty::node(record);
}

} // namespace tyflow::analyzer
