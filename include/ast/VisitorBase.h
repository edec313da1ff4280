/***
 * Name: tyflow::ast::VisitorBase
 * Purpose: One pure-virtual visit per concrete node, so a visitor that misses
 *   a node kind fails to compile instead of at dispatch time.
 */
#pragma once

#include "ast/Nodes.h"

namespace tyflow::ast {

struct VisitorBase {
  virtual ~VisitorBase() = default;
  virtual void visit(const Module&) = 0;
  virtual void visit(const ExprStmt&) = 0;
  virtual void visit(const AssignStmt&) = 0;
  virtual void visit(const LetStmt&) = 0;
  virtual void visit(const BlockStmt&) = 0;
  virtual void visit(const IfStmt&) = 0;
  virtual void visit(const WhileStmt&) = 0;
  virtual void visit(const StringLiteral&) = 0;
  virtual void visit(const NumberLiteral&) = 0;
  virtual void visit(const BoolLiteral&) = 0;
  virtual void visit(const NullLiteral&) = 0;
  virtual void visit(const Name&) = 0;
  virtual void visit(const Attribute&) = 0;
  virtual void visit(const NamedExpr&) = 0;
  virtual void visit(const ObjectLiteral&) = 0;
};

} // namespace tyflow::ast
