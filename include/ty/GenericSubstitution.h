/***
 * Name: tyflow::ty::GenericSubstitution
 * Purpose: Default generic-instance resolver.
 * Inputs: An InstanceType (generic plus arguments).
 * Outputs: The generic body with every parameter placeholder replaced.
 * Theory of Operation:
 *   Walks the body. Placeholders matching a parameter become the argument at
 *   the same position (Unknown when the instance supplies too few). Unions
 *   are re-folded through a builder. Shapes are copied only when something
 *   inside them changed; each copy is memoised before its fields are filled,
 *   so cyclic records come out cyclic instead of recursing forever.
 */
#pragma once

#include "ty/Resolvers.h"
#include "ty/Ty.h"

#include <unordered_map>

namespace tyflow::ty {

    class TypeContext;
    class TypeNode;
    class UnresolvedType;

    class GenericSubstitution final : public InstanceResolver {
    public:
        explicit GenericSubstitution(TypeContext& types) : types_(types) {}

        Ty unwrapGenericInstance(const InstanceType& instance) override;

    private:
        using Bindings = std::unordered_map<const UnresolvedType*, Ty>;
        using Memo = std::unordered_map<const TypeNode*, Ty>;

        Ty substitute(const Ty& ty, const Bindings& bindings, Memo& memo);

        TypeContext& types_;
    };

} // namespace tyflow::ty
