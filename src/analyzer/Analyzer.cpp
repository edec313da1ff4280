/***
 * Name: tyflow::analyzer::Analyzer (core)
 * Purpose: Scope management, binding access, diagnostics and evaluation entry points.
 */
#include "analyzer/Analyzer.h"

#include "ast/Visitor.h"
#include "observability/Metrics.h"

#include <ostream>

namespace tyflow::analyzer {

/*** Name: Analyzer::Analyzer */
Analyzer::Analyzer(ty::TypeContext& types, std::vector<Diagnostic>& diags, AnalyzerOptions options)
    : types_(types), diags_(&diags), options_(options) {}

/*** Name: Analyzer::execModule */
void Analyzer::execModule(const ast::Module& mod) {
  for (const auto& stmt : mod.body) {
    if (stmt) execStatement(*stmt);
  }
}

/*** Name: Analyzer::execStatement */
void Analyzer::execStatement(const ast::Stmt& stmt) { ast::dispatch(stmt, *this); }

/*** Name: Analyzer::execExpression */
ty::Ty Analyzer::execExpression(const ast::Expr& expr) {
  out_ = ty::Ty{};
  ast::dispatch(expr, *this);
  expr.setType(out_);
  return out_;
}

void Analyzer::pushScope() { pushScopeOfKind(ScopeKind::Normal); }
void Analyzer::pushIndeterminateScope() { pushScopeOfKind(ScopeKind::Indeterminate); }
void Analyzer::pushLoopScope() { pushScopeOfKind(ScopeKind::Loop); }

/*** Name: Analyzer::pushScopeOfKind */
void Analyzer::pushScopeOfKind(ScopeKind kind) {
  scopes_.push(kind);
  if (options_.metrics) options_.metrics->incCounter("analyzer.scopes.pushed");
  if (options_.trace) *options_.trace << "push " << scopeKindName(kind) << " depth=" << scopes_.depth() << '\n';
}

/*** Name: Analyzer::popScope */
void Analyzer::popScope() {
  const ScopeKind kind = scopes_.topKind();
  const std::size_t merged = scopes_.pop(types_);
  if (options_.metrics) options_.metrics->incCounter("analyzer.scopes.merged_bindings", merged);
  if (options_.trace) {
    *options_.trace << "pop " << scopeKindName(kind) << " depth=" << scopes_.depth() << " merged=" << merged << '\n';
  }
}

/*** Name: Analyzer::discardScope */
void Analyzer::discardScope() {
  const ScopeKind kind = scopes_.topKind();
  scopes_.discard();
  if (options_.trace) *options_.trace << "discard " << scopeKindName(kind) << " depth=" << scopes_.depth() << '\n';
}

void Analyzer::declare(const std::string& name, const ty::Ty& ty) { scopes_.declare(name, ty); }

std::optional<ty::Ty> Analyzer::lookup(const std::string& name) const { return scopes_.lookup(name); }

/*** Name: Analyzer::assign */
void Analyzer::assign(const std::string& name, const ty::Ty& value, const ast::Node* at) {
  if (!scopes_.assign(name, value)) {
    report("assignment to undeclared name: " + name, at);
    // Keep going as if it had been declared here.
    scopes_.declare(name, value);
  }
}

/*** Name: Analyzer::report */
void Analyzer::report(const std::string& msg, const ast::Node* at) {
  Diagnostic d;
  d.message = msg;
  if (at != nullptr) d.loc = at->loc;
  diags_->push_back(std::move(d));
  if (options_.metrics) options_.metrics->incCounter("analyzer.diagnostics");
}

} // namespace tyflow::analyzer
