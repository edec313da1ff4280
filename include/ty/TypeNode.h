/***
 * Name: tyflow::ty::TypeNode
 * Purpose: Base class for every arena-owned type shape.
 * Theory of Operation:
 *   Nodes get a dense id from the TypeArena on allocation. Structural hash and
 *   equality are deep: subclasses compare and hash nested Ty members through
 *   the walk they are handed, which carries the cycle guard.
 */
#pragma once

#include "ty/TyKind.h"

#include <cstddef>
#include <cstdint>

namespace tyflow::ty {

    namespace detail {
        class EqualityWalk;
        class HashWalk;
    } // namespace detail

    class TypeNode {
    public:
        explicit TypeNode(TyKind kind) : kind_(kind) {}
        virtual ~TypeNode() = default;

        TypeNode(const TypeNode&) = delete;
        TypeNode& operator=(const TypeNode&) = delete;

        TyKind kind() const { return kind_; }
        std::uint32_t id() const { return id_; }

        // Fresh walk from this node.
        std::size_t structuralHash() const;
        bool structurallyEquals(const TypeNode& other) const;

        virtual std::size_t hashShape(detail::HashWalk& walk) const = 0;
        // Callers guarantee other.kind() == kind().
        virtual bool sameShape(const TypeNode& other, detail::EqualityWalk& walk) const = 0;

    private:
        friend class TypeArena;

        TyKind kind_;
        std::uint32_t id_{0};
    };

} // namespace tyflow::ty
