/***
 * Name: tyflow::ty::TypePrinter
 * Purpose: Convert Ty values into TypeSyntax trees.
 * Theory of Operation:
 *   Unions are expanded with UnionType::forEach, the same enumeration used for
 *   property distribution. Error prints as `any`. A record, interface or
 *   callable met again while it is still being printed prints as `any`.
 */
#pragma once

#include "ty/Ty.h"
#include "ty/TypeSyntax.h"
#include "ty/UnionType.h"

#include <memory>
#include <unordered_set>

namespace tyflow::ty {

    class TypePrinter {
    public:
        std::unique_ptr<TypeSyntax> print(const Ty& ty);
        std::unique_ptr<TypeSyntax> printUnion(const UnionType& u);

    private:
        std::unique_ptr<TypeSyntax> printShape(const Ty& ty);

        std::unordered_set<const TypeNode*> active_;
    };

    // Shorthand for renderTypeSyntax(*TypePrinter{}.print(ty)).
    std::string typeToString(const Ty& ty);

} // namespace tyflow::ty
