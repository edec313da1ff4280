/***
 * Name: tyflow::ty::TyKind
 * Purpose: Enumerate the value-shape kinds tracked by the analyzer.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace tyflow::ty {

    enum class TyKind : std::uint8_t {
        Never,
        Error,
        Any,
        Unknown,
        // Primitive singletons
        Object,
        Void,
        Null,
        Undefined,
        String,
        Number,
        BigInt,
        Symbol,
        Boolean,
        // Literals
        StringLiteral,
        NumericLiteral,
        BigIntLiteral,
        UniqueSymbol,
        BooleanLiteral,
        // Arena-owned shapes
        Union,
        Record,
        Function,
        Constructor,
        Interface,
        Intersection,
        Namespace,
        Generic,
        Intrinsic,
        Instance,
        Unresolved,
    };

    std::string_view kindName(TyKind k);

    // True for kinds whose payload is an arena-owned TypeNode.
    constexpr bool isNodeKind(TyKind k) { return k >= TyKind::Union; }

    // True for kinds carrying no payload at all.
    constexpr bool isSimpleKind(TyKind k) { return k <= TyKind::Boolean; }

} // namespace tyflow::ty
