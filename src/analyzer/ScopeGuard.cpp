/***
 * Name: ScopeGuard
 * Purpose: Push on construction; pop (or discard while unwinding) on destruction.
 */
#include "analyzer/ScopeGuard.h"

#include "analyzer/Analyzer.h"

#include <exception>

namespace tyflow::analyzer {

ScopeGuard::ScopeGuard(Analyzer& analyzer, ScopeKind kind) : owner(analyzer), uncaught(std::uncaught_exceptions()) {
  switch (kind) {
    case ScopeKind::Normal: owner.pushScope(); break;
    case ScopeKind::Indeterminate: owner.pushIndeterminateScope(); break;
    case ScopeKind::Loop: owner.pushLoopScope(); break;
  }
}

ScopeGuard::~ScopeGuard() noexcept(false) {
  if (std::uncaught_exceptions() > uncaught) {
    owner.discardScope();
    return;
  }
  owner.popScope();
}

} // namespace tyflow::analyzer
