/***
 * Name: tyflow::analyzer::ScopeStack
 * Purpose: Strictly nested stack of control-flow frames holding binding states.
 * Inputs:
 *   - push(kind) at control-construct entry, pop(types) at exit
 *   - declare/assign/lookup from the evaluator
 * Outputs:
 *   - Narrowed binding types at the current program point
 * Theory of Operation:
 *   A Normal root frame is always present and can never be popped. Lookups
 *   search from the top frame down. Writes always land in the top frame; pop
 *   folds them into the new top frame with mergeBinding.
 */
#pragma once

#include "analyzer/Scope.h"
#include "ty/Ty.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tyflow::analyzer {

    class ScopeStack {
    public:
        ScopeStack();

        void push(ScopeKind kind);
        // Returns the number of bindings merged into the parent. Throws InvariantError on underflow.
        std::size_t pop(ty::TypeContext& types);
        // Drops the top frame without merging (abrupt exits).
        void discard();

        void declare(const std::string& name, const ty::Ty& ty);
        // False when the name is not declared in any live frame.
        bool assign(const std::string& name, const ty::Ty& ty);
        std::optional<ty::Ty> lookup(const std::string& name) const;

        std::size_t depth() const { return frames_.size(); }
        ScopeKind topKind() const { return frames_.back().kind; }

    private:
        std::optional<ty::Ty> lookupBelow(std::size_t frameCount, const std::string& name) const;
        bool isDeclared(const std::string& name) const;

        std::vector<Scope> frames_;
    };

} // namespace tyflow::analyzer
