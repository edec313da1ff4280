/***
 * Name: tyflow::ty::Ty (definitions)
 * Purpose: Factories, equality and hashing for Ty values.
 */
#include "ty/Ty.h"

#include "ty/TypeNode.h"
#include "ty/detail/HashCombine.h"
#include "ty/detail/Structural.h"
#include "tyflow/exceptions/invariant_error.h"

#include <bit>
#include <cmath>
#include <string>

namespace tyflow::ty {

    /*** Name: NumberValue::bits */
    std::uint64_t NumberValue::bits() const {
        if (std::isnan(value)) { return 0x7ff8000000000000ULL; }
        return std::bit_cast<std::uint64_t>(value);
    }

    /*** Name: Ty::of */
    Ty Ty::of(TyKind kind) {
        if (!isSimpleKind(kind)) {
            throw exceptions::InvariantError(std::string("Ty::of called with payload kind: ") + std::string(kindName(kind)));
        }
        return Ty{kind, std::monostate{}};
    }

    /*** Name: Ty::stringLiteral */
    Ty Ty::stringLiteral(std::string_view interned) { return Ty{TyKind::StringLiteral, interned}; }

    /*** Name: Ty::numericLiteral */
    Ty Ty::numericLiteral(double value) { return Ty{TyKind::NumericLiteral, NumberValue{value}}; }

    /*** Name: Ty::bigintLiteral */
    Ty Ty::bigintLiteral(std::string_view interned) { return Ty{TyKind::BigIntLiteral, interned}; }

    /*** Name: Ty::uniqueSymbol */
    Ty Ty::uniqueSymbol(SymbolId symbol) { return Ty{TyKind::UniqueSymbol, symbol}; }

    /*** Name: Ty::booleanLiteral */
    Ty Ty::booleanLiteral(bool value) { return Ty{TyKind::BooleanLiteral, value}; }

    /*** Name: Ty::node */
    Ty Ty::node(const TypeNode* node) {
        if (node == nullptr) { throw exceptions::InvariantError("Ty::node called with null node"); }
        return Ty{node->kind(), node};
    }

    /*** Name: Ty::identical */
    bool Ty::identical(const Ty& other) const {
        return kind_ == other.kind_ && payload_ == other.payload_;
    }

    /*** Name: Ty::shallowHash */
    std::size_t Ty::shallowHash() const {
        std::size_t seed = std::hash<int>{}(static_cast<int>(kind_));
        std::size_t value = 0;
        switch (payload_.index()) {
            case 0: return seed;
            case 1: value = std::hash<bool>{}(std::get<bool>(payload_)); break;
            case 2: value = std::hash<NumberValue>{}(std::get<NumberValue>(payload_)); break;
            case 3: value = std::hash<std::string_view>{}(std::get<std::string_view>(payload_)); break;
            case 4: value = std::hash<SymbolId>{}(std::get<SymbolId>(payload_)); break;
            default: value = std::hash<std::uint32_t>{}(node()->id()); break;
        }
        detail::hashCombine(seed, value);
        return seed;
    }

    /*** Name: Ty::hash */
    std::size_t Ty::hash() const {
        detail::HashWalk walk;
        return walk.hash(*this);
    }

    /*** Name: operator==(Ty, Ty) */
    bool operator==(const Ty& a, const Ty& b) {
        detail::EqualityWalk walk;
        return walk.equal(a, b);
    }

} // namespace tyflow::ty
