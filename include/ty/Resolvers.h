/***
 * Name: tyflow::ty resolver interfaces
 * Purpose: Seams for the collaborators the union algebra consumes.
 * Theory of Operation:
 *   InstanceResolver turns a generic instantiation into its concrete type;
 *   PropertyResolver answers a property read on one (non-distributed) type.
 *   TypeContext installs built-in implementations and lets callers replace them.
 */
#pragma once

#include "ty/PropertyKey.h"
#include "ty/Ty.h"

namespace tyflow::ty {

    class InstanceType;

    class InstanceResolver {
    public:
        virtual ~InstanceResolver() = default;
        virtual Ty unwrapGenericInstance(const InstanceType& instance) = 0;
    };

    class PropertyResolver {
    public:
        virtual ~PropertyResolver() = default;
        virtual Ty getProperty(const Ty& receiver, const PropertyKey& key) = 0;
    };

} // namespace tyflow::ty
