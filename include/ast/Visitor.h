/***
 * Name: tyflow::ast::dispatch
 * Purpose: Central kind switch from a Node to the visitor's typed overload.
 * Theory of Operation:
 *   The tree is only ever read, so dispatch takes const nodes. A kind with
 *   no case means the enum and this switch drifted apart.
 */
#pragma once

#include "ast/Nodes.h"
#include "tyflow/exceptions/invariant_error.h"

#include <string>

namespace tyflow::ast {

template <typename V>
void dispatch(const Node& n, V& v) {
    switch (n.kind) {
        case NodeKind::Module: v.visit(static_cast<const Module&>(n)); return;
        case NodeKind::ExprStmt: v.visit(static_cast<const ExprStmt&>(n)); return;
        case NodeKind::AssignStmt: v.visit(static_cast<const AssignStmt&>(n)); return;
        case NodeKind::LetStmt: v.visit(static_cast<const LetStmt&>(n)); return;
        case NodeKind::BlockStmt: v.visit(static_cast<const BlockStmt&>(n)); return;
        case NodeKind::IfStmt: v.visit(static_cast<const IfStmt&>(n)); return;
        case NodeKind::WhileStmt: v.visit(static_cast<const WhileStmt&>(n)); return;
        case NodeKind::StringLiteral: v.visit(static_cast<const StringLiteral&>(n)); return;
        case NodeKind::NumberLiteral: v.visit(static_cast<const NumberLiteral&>(n)); return;
        case NodeKind::BoolLiteral: v.visit(static_cast<const BoolLiteral&>(n)); return;
        case NodeKind::NullLiteral: v.visit(static_cast<const NullLiteral&>(n)); return;
        case NodeKind::Name: v.visit(static_cast<const Name&>(n)); return;
        case NodeKind::Attribute: v.visit(static_cast<const Attribute&>(n)); return;
        case NodeKind::NamedExpr: v.visit(static_cast<const NamedExpr&>(n)); return;
        case NodeKind::ObjectLiteral: v.visit(static_cast<const ObjectLiteral&>(n)); return;
    }
    throw exceptions::InvariantError("dispatch: no visit for node kind " + std::string(nodeKindName(n.kind)));
}

} // namespace tyflow::ast
