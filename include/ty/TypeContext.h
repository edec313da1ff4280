/***
 * Name: tyflow::ty::TypeContext
 * Purpose: Union-consuming façade used by the rest of the analyzer.
 * Inputs:
 *   - The pass TypeArena; optional Metrics sink.
 * Outputs:
 *   - intoUnion, getOptionalType, getUnionProperty, printUnionType, plus the
 *     property and generic-instance resolvers they depend on.
 * Theory of Operation:
 *   Callers never touch UnionType internals; everything goes through a
 *   UnionTypeBuilder and UnionType::forEach. Built-in resolvers are installed
 *   by default and may be replaced by the embedding analyzer.
 */
#pragma once

#include "ty/BuiltinProperties.h"
#include "ty/GenericSubstitution.h"
#include "ty/PropertyKey.h"
#include "ty/Resolvers.h"
#include "ty/Ty.h"
#include "ty/TypeArena.h"
#include "ty/TypeSyntax.h"
#include "ty/UnionType.h"
#include "ty/UnionTypeBuilder.h"

#include <initializer_list>
#include <memory>
#include <vector>

namespace tyflow::obs { class Metrics; }

namespace tyflow::ty {

    class TypeContext final : public InstanceResolver {
    public:
        explicit TypeContext(TypeArena& arena, obs::Metrics* metrics = nullptr);

        TypeArena& arena() { return *arena_; }
        obs::Metrics* metrics() { return metrics_; }

        // 0 members -> Undefined (not Never); 1 member -> returned as-is.
        Ty intoUnion(const std::vector<Ty>& members);
        Ty intoUnion(std::initializer_list<Ty> members);

        // `T | undefined` when optional.
        Ty getOptionalType(bool optional, const Ty& ty);

        // (A | B).key == A.key | B.key
        Ty getUnionProperty(const UnionType& u, const PropertyKey& key);

        std::unique_ptr<TypeSyntax> printUnionType(const UnionType& u) const;

        Ty getProperty(const Ty& receiver, const PropertyKey& key);
        Ty unwrapGenericInstance(const InstanceType& instance) override;

        // nullptr restores the built-in resolver.
        void setPropertyResolver(PropertyResolver* resolver);
        void setInstanceResolver(InstanceResolver* resolver);

        // Builder result bookkeeping shared by every fold.
        Ty finish(UnionTypeBuilder& builder);

    private:
        TypeArena* arena_;
        obs::Metrics* metrics_;
        BuiltinProperties builtinProperties_;
        GenericSubstitution substitution_;
        PropertyResolver* properties_;
        InstanceResolver* instances_;
    };

} // namespace tyflow::ty
