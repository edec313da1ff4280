/***
 * Name: tyflow::ty shapes
 * Purpose: Arena-owned complex type shapes (records, callables, interfaces, ...).
 * Inputs: Filled in by whoever allocates them, before they are published as a Ty.
 * Outputs: Read-only shapes referenced by Ty values.
 * Theory of Operation:
 *   Fields are public the way AST nodes are; a shape is only written while it is
 *   being built and never after a Ty refers to it. Generic parameters are
 *   UnresolvedType placeholders, so substitution is a walk that swaps those
 *   placeholders for instance arguments.
 */
#pragma once

#include "ty/PropertyKey.h"
#include "ty/Ty.h"
#include "ty/TypeNode.h"

#include <cstddef>
#include <string>
#include <vector>

namespace tyflow::ty {

    struct PropertySlot {
        PropertyKey key;
        Ty type;
        bool optional{false};
    };

    struct ParamSlot {
        std::string name;
        Ty type;
        bool optional{false};
    };

    // Object literal shape.
    class RecordType final : public TypeNode {
    public:
        RecordType() : TypeNode(TyKind::Record) {}

        std::vector<PropertySlot> properties;

        const PropertySlot* find(const PropertyKey& key) const;

        std::size_t hashShape(detail::HashWalk& walk) const override;
        bool sameShape(const TypeNode& other, detail::EqualityWalk& walk) const override;
    };

    // Call or construct signature; kind is Function or Constructor.
    class CallableType final : public TypeNode {
    public:
        explicit CallableType(TyKind kind);

        std::vector<ParamSlot> params;
        Ty returns{Ty::of(TyKind::Void)};

        std::size_t requiredParams() const;

        std::size_t hashShape(detail::HashWalk& walk) const override;
        bool sameShape(const TypeNode& other, detail::EqualityWalk& walk) const override;
    };

    class InterfaceType final : public TypeNode {
    public:
        explicit InterfaceType(std::string n) : TypeNode(TyKind::Interface), name(std::move(n)) {}

        std::string name;
        std::vector<PropertySlot> properties;

        const PropertySlot* find(const PropertyKey& key) const;

        std::size_t hashShape(detail::HashWalk& walk) const override;
        bool sameShape(const TypeNode& other, detail::EqualityWalk& walk) const override;
    };

    class IntersectionType final : public TypeNode {
    public:
        IntersectionType() : TypeNode(TyKind::Intersection) {}

        std::vector<Ty> members;

        std::size_t hashShape(detail::HashWalk& walk) const override;
        bool sameShape(const TypeNode& other, detail::EqualityWalk& walk) const override;
    };

    class NamespaceType final : public TypeNode {
    public:
        explicit NamespaceType(std::string n) : TypeNode(TyKind::Namespace), name(std::move(n)) {}

        std::string name;
        std::vector<PropertySlot> members;

        const PropertySlot* find(const PropertyKey& key) const;

        std::size_t hashShape(detail::HashWalk& walk) const override;
        bool sameShape(const TypeNode& other, detail::EqualityWalk& walk) const override;
    };

    // Placeholder pending later resolution; equal only to itself.
    class UnresolvedType final : public TypeNode {
    public:
        explicit UnresolvedType(std::string n) : TypeNode(TyKind::Unresolved), name(std::move(n)) {}

        std::string name;

        std::size_t hashShape(detail::HashWalk& walk) const override;
        bool sameShape(const TypeNode& other, detail::EqualityWalk& walk) const override;
    };

    class GenericType final : public TypeNode {
    public:
        explicit GenericType(std::string n) : TypeNode(TyKind::Generic), name(std::move(n)) {}

        std::string name;
        std::vector<const UnresolvedType*> params;
        Ty body{};

        std::size_t hashShape(detail::HashWalk& walk) const override;
        bool sameShape(const TypeNode& other, detail::EqualityWalk& walk) const override;
    };

    class IntrinsicType final : public TypeNode {
    public:
        explicit IntrinsicType(std::string n) : TypeNode(TyKind::Intrinsic), name(std::move(n)) {}

        std::string name;

        std::size_t hashShape(detail::HashWalk& walk) const override;
        bool sameShape(const TypeNode& other, detail::EqualityWalk& walk) const override;
    };

    class InstanceType final : public TypeNode {
    public:
        explicit InstanceType(const GenericType* g) : TypeNode(TyKind::Instance), generic(g) {}

        const GenericType* generic;
        std::vector<Ty> args;

        std::size_t hashShape(detail::HashWalk& walk) const override;
        bool sameShape(const TypeNode& other, detail::EqualityWalk& walk) const override;
    };

} // namespace tyflow::ty
