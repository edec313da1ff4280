/***
 * Name: tyflow::analyzer::Scope helpers
 * Purpose: Scope kind names and the pop-time merge policy.
 */
#include "analyzer/Scope.h"

#include "ty/TypeContext.h"

namespace tyflow::analyzer {

    /*** Name: scopeKindName */
    std::string_view scopeKindName(ScopeKind kind) {
        switch (kind) {
            case ScopeKind::Normal: return "normal";
            case ScopeKind::Indeterminate: return "indeterminate";
            case ScopeKind::Loop: return "loop";
        }
        return "?";
    }

    /*** Name: mergeBinding */
    ty::Ty mergeBinding(ScopeKind kind, ty::TypeContext& types, const std::optional<ty::Ty>& before, const ty::Ty& after) {
        const ty::Ty prior = before.value_or(ty::Ty::of(ty::TyKind::Undefined));
        switch (kind) {
            case ScopeKind::Normal:
                return after;
            // Branch or loop body may not have run: before | after.
            case ScopeKind::Indeterminate:
            case ScopeKind::Loop:
                return types.intoUnion({prior, after});
        }
        return after;
    }

} // namespace tyflow::analyzer
