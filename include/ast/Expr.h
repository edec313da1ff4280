/***
 * Name: tyflow::ast expressions
 * Purpose: Expression nodes the analyzer evaluates to a ty::Ty.
 * Theory of Operation:
 *   Every expression records the type it evaluated to on its most recent
 *   visit. The slot is mutable because the analyzer walks a const tree.
 */
#pragma once

#include "ast/Node.h"
#include "ty/Ty.h"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tyflow::ast {

    struct Expr : Node {
        using Node::Node;

        void setType(const ty::Ty& t) const { evaluated_ = t; }
        std::optional<ty::Ty> type() const { return evaluated_; }

    private:
        mutable std::optional<ty::Ty> evaluated_{};
    };

    using ExprPtr = std::unique_ptr<Expr>;

    struct StringLiteral final : Expr {
        std::string value;
        explicit StringLiteral(std::string v) : Expr(NodeKind::StringLiteral), value(std::move(v)) {}
    };

    struct NumberLiteral final : Expr {
        double value;
        explicit NumberLiteral(double v) : Expr(NodeKind::NumberLiteral), value(v) {}
    };

    struct BoolLiteral final : Expr {
        bool value;
        explicit BoolLiteral(bool v) : Expr(NodeKind::BoolLiteral), value(v) {}
    };

    struct NullLiteral final : Expr {
        NullLiteral() : Expr(NodeKind::NullLiteral) {}
    };

    // Identifier read. `undefined` is an identifier in the scripting language.
    struct Name final : Expr {
        std::string id;
        explicit Name(std::string s) : Expr(NodeKind::Name), id(std::move(s)) {}

        bool isUndefinedKeyword() const { return id == "undefined"; }
    };

    // `value.attr`
    struct Attribute final : Expr {
        ExprPtr value;
        std::string attr;
        Attribute(ExprPtr v, std::string a) : Expr(NodeKind::Attribute), value(std::move(v)), attr(std::move(a)) {}
    };

    // `(target = value)` used as a value.
    struct NamedExpr final : Expr {
        std::string target;
        ExprPtr value;
        NamedExpr(std::string t, ExprPtr v) : Expr(NodeKind::NamedExpr), target(std::move(t)), value(std::move(v)) {}
    };

    struct ObjectField {
        std::string key;
        ExprPtr value;
    };

    // `{ key: value, ... }`; fields in source order, a later duplicate key wins.
    struct ObjectLiteral final : Expr {
        std::vector<ObjectField> fields;
        ObjectLiteral() : Expr(NodeKind::ObjectLiteral) {}
    };

} // namespace tyflow::ast
