/***
 * Name: tyflow::analyzer::Diagnostic
 * Purpose: Carry a diagnostic message with optional source location.
 */
#pragma once

#include "ast/Node.h"

#include <string>

namespace tyflow::analyzer {
    struct Diagnostic {
        std::string message;
        ast::SourceLoc loc{};
    };
} // namespace tyflow::analyzer
