/***
 * Name: tyflow::ast (all nodes)
 * Purpose: Single include for every node the analyzer understands.
 */
#pragma once

#include "ast/Expr.h"
#include "ast/Node.h"
#include "ast/Stmt.h"
