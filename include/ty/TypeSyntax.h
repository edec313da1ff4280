/***
 * Name: tyflow::ty::TypeSyntax
 * Purpose: Annotation-syntax tree produced by the type printer.
 * Inputs: Built by TypePrinter (or by hand in tests).
 * Outputs: renderTypeSyntax() text such as `"a" | 1 | { x?: string }`.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

namespace tyflow::ty {

    enum class TypeSyntaxKind {
        Keyword,          // string, number, any, never, ...
        StringLiteral,
        NumberLiteral,
        BigIntLiteral,
        BooleanLiteral,
        UniqueSymbol,
        TypeLiteral,      // { a: T; b?: U }
        Function,         // (a: T) => R
        Constructor,      // new (a: T) => R
        Reference,        // Name or Name<Args>
        Intersection,
        Union,
    };

    struct TypeSyntax;

    struct TypeSyntaxMember {
        std::string name;
        bool optional{false};
        std::unique_ptr<TypeSyntax> type;
    };

    struct TypeSyntax {
        TypeSyntaxKind kind{TypeSyntaxKind::Keyword};
        std::string text{};                             // keyword, literal text or reference name
        std::vector<std::unique_ptr<TypeSyntax>> types{}; // union/intersection members, reference args, return type last for signatures
        std::vector<TypeSyntaxMember> members{};        // type literal properties or signature params
    };

    std::string renderTypeSyntax(const TypeSyntax& node);

} // namespace tyflow::ty
