/***
 * Name: tyflow::ast::nodeKindName
 * Purpose: Stable spelling of a node kind for diagnostics and traces.
 */
#include "ast/Node.h"

namespace tyflow::ast {

std::string_view nodeKindName(NodeKind kind) {
    switch (kind) {
        case NodeKind::Module: return "Module";
        case NodeKind::ExprStmt: return "ExprStmt";
        case NodeKind::AssignStmt: return "AssignStmt";
        case NodeKind::LetStmt: return "LetStmt";
        case NodeKind::BlockStmt: return "BlockStmt";
        case NodeKind::IfStmt: return "IfStmt";
        case NodeKind::WhileStmt: return "WhileStmt";
        case NodeKind::StringLiteral: return "StringLiteral";
        case NodeKind::NumberLiteral: return "NumberLiteral";
        case NodeKind::BoolLiteral: return "BoolLiteral";
        case NodeKind::NullLiteral: return "NullLiteral";
        case NodeKind::Name: return "Name";
        case NodeKind::Attribute: return "Attribute";
        case NodeKind::NamedExpr: return "NamedExpr";
        case NodeKind::ObjectLiteral: return "ObjectLiteral";
    }
    return "?";
}

} // namespace tyflow::ast
