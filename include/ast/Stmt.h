/***
 * Name: tyflow::ast statements
 * Purpose: Statement nodes and the module root.
 * Theory of Operation:
 *   Control statements own their sub-statements; which scope kind each
 *   sub-statement runs in is decided by the analyzer, not recorded here.
 */
#pragma once

#include "ast/Expr.h"
#include "ast/Node.h"
#include "ty/Ty.h"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tyflow::ast {

    struct Stmt : Node {
        using Node::Node;
    };

    using StmtPtr = std::unique_ptr<Stmt>;
    using StmtList = std::vector<StmtPtr>;

    struct ExprStmt final : Stmt {
        ExprPtr value;
        explicit ExprStmt(ExprPtr v) : Stmt(NodeKind::ExprStmt), value(std::move(v)) {}
    };

    // `target = value`; a null value evaluates as undefined.
    struct AssignStmt final : Stmt {
        std::string target;
        ExprPtr value;
        AssignStmt(std::string t, ExprPtr v) : Stmt(NodeKind::AssignStmt), target(std::move(t)), value(std::move(v)) {}
    };

    /***
     * Name: tyflow::ast::LetStmt
     * Purpose: Block-scoped declaration `let name[?][: annotation] [= init]`.
     * Theory of Operation:
     *   The annotation is already resolved to a type by the front end; the
     *   analyzer only narrows it.
     */
    struct LetStmt final : Stmt {
        std::string name;
        std::optional<ty::Ty> annotation;
        bool optional{false};
        ExprPtr init; // may be null
        LetStmt(std::string n, ExprPtr i) : Stmt(NodeKind::LetStmt), name(std::move(n)), init(std::move(i)) {}
    };

    // `{ ... }` with its own lexical scope.
    struct BlockStmt final : Stmt {
        StmtList body;
        BlockStmt() : Stmt(NodeKind::BlockStmt) {}
    };

    struct IfStmt final : Stmt {
        ExprPtr cond;
        StmtPtr consequent;
        StmtPtr alternate; // may be null
        IfStmt(ExprPtr c, StmtPtr t, StmtPtr e = nullptr)
            : Stmt(NodeKind::IfStmt), cond(std::move(c)), consequent(std::move(t)), alternate(std::move(e)) {}
    };

    struct WhileStmt final : Stmt {
        ExprPtr cond;
        StmtPtr body;
        WhileStmt(ExprPtr c, StmtPtr b) : Stmt(NodeKind::WhileStmt), cond(std::move(c)), body(std::move(b)) {}
    };

    struct Module final : Node {
        StmtList body;
        Module() : Node(NodeKind::Module) {}
    };

} // namespace tyflow::ast
