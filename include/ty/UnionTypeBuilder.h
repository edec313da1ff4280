/***
 * Name: tyflow::ty::UnionTypeBuilder
 * Purpose: Monotone accumulator that folds any number of types into one canonical type.
 * Inputs:
 *   - add(resolver, ty) for each candidate member
 * Outputs:
 *   - build(arena): Never / Error / Any / Unknown, the sole member when only
 *     one survived, or an arena-owned Union
 * Theory of Operation:
 *   State only moves upward: Never -> Compound -> {Error, Any, Unknown}.
 *   Error, Generic, Intrinsic and Namespace cannot be modelled inside a union
 *   and escalate to Error. The first of Any/Unknown to arrive wins. Nested
 *   unions are re-added member by member and generic instances are unwrapped
 *   through the resolver, so the result is always flat.
 */
#pragma once

#include "ty/Resolvers.h"
#include "ty/Ty.h"
#include "ty/TypeArena.h"
#include "ty/UnionType.h"

#include <memory>

namespace tyflow::ty {

    class UnionTypeBuilder {
    public:
        enum class State { Never, Compound, Error, Any, Unknown };

        void add(InstanceResolver& resolver, const Ty& ty);

        // Leaves the builder back in the Never state.
        Ty build(TypeArena& arena);

        State state() const { return state_; }
        bool isTerminal() const { return state_ == State::Error || state_ == State::Any || state_ == State::Unknown; }

    private:
        State state_{State::Never};
        std::unique_ptr<UnionType> compound_;
    };

} // namespace tyflow::ty
