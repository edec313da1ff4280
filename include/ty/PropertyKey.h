/***
 * Name: tyflow::ty::PropertyKey
 * Purpose: Key of a property read: a plain name or a unique symbol.
 */
#pragma once

#include "ty/Ty.h"

#include <string>
#include <utility>

namespace tyflow::ty {

    struct PropertyKey {
        enum class Kind { Name, Symbol };

        Kind kind{Kind::Name};
        std::string name{};
        SymbolId symbol{};

        static PropertyKey named(std::string n) { return PropertyKey{Kind::Name, std::move(n), SymbolId{}}; }
        static PropertyKey ofSymbol(SymbolId s) { return PropertyKey{Kind::Symbol, std::string{}, s}; }

        std::string toString() const;

        friend bool operator==(const PropertyKey& a, const PropertyKey& b) {
            if (a.kind != b.kind) return false;
            return a.kind == Kind::Name ? a.name == b.name : a.symbol == b.symbol;
        }
    };

} // namespace tyflow::ty
