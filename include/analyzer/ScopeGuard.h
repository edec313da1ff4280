/***
 * Name: ScopeGuard
 * Purpose: RAII guard that pushes a scope and pops it on every exit path.
 * Theory of Operation:
 *   Normal exit pops with the kind's merge policy. When the guarded region is
 *   left by an exception the frame is discarded instead, so half-evaluated
 *   state never merges into the parent.
 */
#pragma once

#include "analyzer/Scope.h"

namespace tyflow::analyzer {

class Analyzer;

struct ScopeGuard {
  ScopeGuard(Analyzer& analyzer, ScopeKind kind);
  ~ScopeGuard() noexcept(false);

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;

  Analyzer& owner;
  int uncaught;
};

} // namespace tyflow::analyzer
