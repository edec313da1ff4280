/***
 * Name: tyflow::ty::TypeArena::intern
 * Purpose: Return a view of `text` that stays valid for the arena's lifetime.
 */
#include "ty/TypeArena.h"

namespace tyflow::ty {

std::string_view TypeArena::intern(std::string_view text) {
    const auto [it, inserted] = atoms_.emplace(text);
    (void)inserted;
    return std::string_view{*it};
}

} // namespace tyflow::ty
