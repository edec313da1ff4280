/***
 * Name: tyflow::ty::BuiltinProperties
 * Purpose: Default per-kind property resolver.
 * Inputs: A receiver type and a property key.
 * Outputs: The type of reading that property from one receiver.
 * Theory of Operation:
 *   Unions are distributed through TypeContext::getUnionProperty and
 *   instances are unwrapped first. Reading through null, undefined or void
 *   throws at runtime, so no value flows out and the result is Never.
 *   Exact object-literal records read a missing key as undefined; interfaces,
 *   namespaces and everything without a model read it as unknown.
 */
#pragma once

#include "ty/Resolvers.h"

namespace tyflow::ty {

    class TypeContext;
    struct PropertySlot;

    class BuiltinProperties final : public PropertyResolver {
    public:
        explicit BuiltinProperties(TypeContext& types) : types_(types) {}

        Ty getProperty(const Ty& receiver, const PropertyKey& key) override;

    private:
        Ty slotType(const PropertySlot* slot, const Ty& missing);
        Ty fromIntersection(const Ty& receiver, const PropertyKey& key);
        Ty fromCallable(const Ty& receiver, const PropertyKey& key);

        TypeContext& types_;
    };

} // namespace tyflow::ty
