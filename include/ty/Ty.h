/***
 * Name: tyflow::ty::Ty
 * Purpose: A single value-shape: kind tag plus literal or arena payload.
 * Inputs:
 *   - Factories for simple kinds, literals and arena nodes.
 * Outputs:
 *   - A cheap copyable value usable as a hash key.
 * Theory of Operation:
 *   Simple kinds carry no payload. Literal kinds carry their value (strings
 *   are arena-interned views). Every other kind points at a TypeNode owned by
 *   the pass TypeArena. Equality compares node identity first and then the
 *   whole structure; see detail/Structural.h for how cycles terminate.
 */
#pragma once

#include "ty/TyKind.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <variant>

namespace tyflow::ty {

    class TypeNode;
    class UnionType;

    /*** SymbolId: identity of a unique symbol issued by the TypeArena. */
    struct SymbolId {
        std::uint32_t value{0};
        friend bool operator==(SymbolId a, SymbolId b) { return a.value == b.value; }
    };

    /***
     * Name: NumberValue
     * Purpose: Numeric literal payload with bitwise equality (all NaNs collapse to one).
     */
    struct NumberValue {
        double value{0.0};
        std::uint64_t bits() const;
        friend bool operator==(const NumberValue& a, const NumberValue& b) { return a.bits() == b.bits(); }
    };

    class Ty {
    public:
        // Default-constructed Ty is Never, the identity of union.
        Ty() = default;

        // Payload-less kinds only (Never .. Boolean); throws InvariantError otherwise.
        static Ty of(TyKind kind);
        static Ty stringLiteral(std::string_view interned);
        static Ty numericLiteral(double value);
        static Ty bigintLiteral(std::string_view interned);
        static Ty uniqueSymbol(SymbolId symbol);
        static Ty booleanLiteral(bool value);
        // Kind taken from the node.
        static Ty node(const TypeNode* node);

        TyKind kind() const { return kind_; }
        bool is(TyKind k) const { return kind_ == k; }

        bool booleanValue() const { return std::get<bool>(payload_); }
        double numberValue() const { return std::get<NumberValue>(payload_).value; }
        std::string_view atom() const { return std::get<std::string_view>(payload_); }
        SymbolId symbol() const { return std::get<SymbolId>(payload_); }
        const TypeNode* node() const { return std::get<const TypeNode*>(payload_); }

        template <typename T>
        const T& as() const { return static_cast<const T&>(*node()); }

        // Same kind and same payload; arena nodes by identity.
        bool identical(const Ty& other) const;
        // Hash that never looks inside arena nodes (uses their ids).
        std::size_t shallowHash() const;
        // Consistent with operator==.
        std::size_t hash() const;

        friend bool operator==(const Ty& a, const Ty& b);

    private:
        using Payload = std::variant<std::monostate, bool, NumberValue, std::string_view, SymbolId, const TypeNode*>;

        Ty(TyKind kind, Payload payload) : kind_(kind), payload_(payload) {}

        TyKind kind_{TyKind::Never};
        Payload payload_{};
    };

} // namespace tyflow::ty

template <>
struct std::hash<tyflow::ty::Ty> {
    std::size_t operator()(const tyflow::ty::Ty& t) const noexcept { return t.hash(); }
};

template <>
struct std::hash<tyflow::ty::SymbolId> {
    std::size_t operator()(tyflow::ty::SymbolId s) const noexcept { return std::hash<std::uint32_t>{}(s.value); }
};

template <>
struct std::hash<tyflow::ty::NumberValue> {
    std::size_t operator()(const tyflow::ty::NumberValue& n) const noexcept { return std::hash<std::uint64_t>{}(n.bits()); }
};
