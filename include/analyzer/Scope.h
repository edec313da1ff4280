/***
 * Name: tyflow::analyzer::Scope
 * Purpose: One control-flow frame and the merge policy applied when it is popped.
 * Theory of Operation:
 *   bindings holds every binding written while this frame was on top: the
 *   initial value of names declared here, and overrides of names declared
 *   further down the stack. Only the overrides survive a pop.
 */
#pragma once

#include "ty/Ty.h"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace tyflow::ty { class TypeContext; }

namespace tyflow::analyzer {

    enum class ScopeKind {
        Normal,        // body runs exactly once
        Indeterminate, // effects may or may not have happened
        Loop,          // body ran zero, one or many times
    };

    std::string_view scopeKindName(ScopeKind kind);

    struct Scope {
        ScopeKind kind{ScopeKind::Normal};
        std::unordered_map<std::string, ty::Ty> bindings;
        std::unordered_set<std::string> declared;
    };

    /***
     * Name: mergeBinding
     * Purpose: Value a surviving binding has in the parent once a frame of `kind` pops.
     * Inputs:
     *   - before: value visible from the parent (nullopt when it has none)
     *   - after: value at the end of the popped frame
     * Outputs: The parent's new value.
     * Theory of Operation:
     *   Normal frames ran once, so `after` is certain. Indeterminate and Loop
     *   frames fold `before | after` (a missing `before` reads as undefined).
     *   For loops this stands for zero-or-more iterations without iterating to
     *   a fixed point.
     */
    ty::Ty mergeBinding(ScopeKind kind, ty::TypeContext& types, const std::optional<ty::Ty>& before, const ty::Ty& after);

} // namespace tyflow::analyzer
