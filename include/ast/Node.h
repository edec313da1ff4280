/***
 * Name: tyflow::ast::Node
 * Purpose: Base of the analyzer's input tree: kind tag and source location.
 * Theory of Operation:
 *   The tree is built by an embedding front end (or by tests) and only read
 *   by the analyzer. Dispatch goes through the central switch in Visitor.h
 *   on `kind`, so nodes carry no virtual accept.
 */
#pragma once

#include <string>
#include <string_view>

namespace tyflow::ast {

    enum class NodeKind {
        Module,
        ExprStmt,
        AssignStmt,
        LetStmt,
        BlockStmt,
        IfStmt,
        WhileStmt,
        StringLiteral,
        NumberLiteral,
        BoolLiteral,
        NullLiteral,
        Name,
        Attribute,
        NamedExpr,
        ObjectLiteral,
    };

    std::string_view nodeKindName(NodeKind kind);

    // Where a node came from; line and col are 1-based, 0 when unknown.
    struct SourceLoc {
        std::string file{};
        int line{0};
        int col{0};
    };

    struct Node {
        explicit Node(NodeKind k) : kind(k) {}
        virtual ~Node() = default;

        NodeKind kind;
        SourceLoc loc{};
    };

} // namespace tyflow::ast
