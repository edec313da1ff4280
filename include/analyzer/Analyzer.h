/***
 * Name: tyflow::analyzer::Analyzer
 * Purpose: Flow-sensitive abstract interpreter over the AST.
 * Inputs:
 *   - A TypeContext for the pass, a diagnostics sink, AnalyzerOptions.
 *   - AST statements and expressions (already built by a front end).
 * Outputs:
 *   - Narrowed binding types (lookup), expression types (execExpression and
 *     Expr::type()), diagnostics.
 * Theory of Operation:
 *   Recursive descent over statements with an explicit ScopeStack. Control
 *   constructs wrap each sub-evaluation in a scope whose kind says how often
 *   it may have run; the stack merges the resulting bindings on pop.
 *   Expression results come back through out_, as visitor outputs do.
 */
#pragma once

#include "analyzer/AnalyzerOptions.h"
#include "analyzer/Diagnostic.h"
#include "analyzer/ScopeStack.h"
#include "ast/Nodes.h"
#include "ast/VisitorBase.h"
#include "ty/TypeContext.h"

#include <optional>
#include <string>
#include <vector>

namespace tyflow::analyzer {

    class Analyzer final : public ast::VisitorBase {
    public:
        Analyzer(ty::TypeContext& types, std::vector<Diagnostic>& diags, AnalyzerOptions options = {});

        void execModule(const ast::Module& mod);
        void execStatement(const ast::Stmt& stmt);
        ty::Ty execExpression(const ast::Expr& expr);

        void execWhileStatement(const ast::WhileStmt& node);
        void execIfStatement(const ast::IfStmt& node);
        void execBlockStatement(const ast::BlockStmt& node);

        void pushScope();
        void pushIndeterminateScope();
        void pushLoopScope();
        void popScope();
        // Pops without merging; used when unwinding.
        void discardScope();

        // Seed or inspect binding state (entry states, tests, embedders).
        void declare(const std::string& name, const ty::Ty& ty);
        std::optional<ty::Ty> lookup(const std::string& name) const;
        std::size_t scopeDepth() const { return scopes_.depth(); }

        ty::TypeContext& types() { return types_; }

        // Visitor overrides
        void visit(const ast::Module&) override;
        void visit(const ast::ExprStmt&) override;
        void visit(const ast::AssignStmt&) override;
        void visit(const ast::LetStmt&) override;
        void visit(const ast::BlockStmt&) override;
        void visit(const ast::IfStmt&) override;
        void visit(const ast::WhileStmt&) override;
        void visit(const ast::StringLiteral&) override;
        void visit(const ast::NumberLiteral&) override;
        void visit(const ast::BoolLiteral&) override;
        void visit(const ast::NullLiteral&) override;
        void visit(const ast::Name&) override;
        void visit(const ast::Attribute&) override;
        void visit(const ast::NamedExpr&) override;
        void visit(const ast::ObjectLiteral&) override;

    private:
        void pushScopeOfKind(ScopeKind kind);
        void assign(const std::string& name, const ty::Ty& value, const ast::Node* at);
        void report(const std::string& msg, const ast::Node* at);

        ty::TypeContext& types_;
        std::vector<Diagnostic>* diags_;
        AnalyzerOptions options_;
        ScopeStack scopes_;
        ty::Ty out_{};
    };

} // namespace tyflow::analyzer
