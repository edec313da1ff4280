/***
 * Name: tyflow::ty::PropertyKey::toString
 * Purpose: Render a key for diagnostics: `name` or `[symbol#N]`.
 */
#include "ty/PropertyKey.h"

namespace tyflow::ty {

std::string PropertyKey::toString() const {
    if (kind == Kind::Name) return name;
    return "[symbol#" + std::to_string(symbol.value) + "]";
}

} // namespace tyflow::ty
