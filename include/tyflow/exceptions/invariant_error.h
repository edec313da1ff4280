/***
 * Name: tyflow::exceptions::InvariantError
 * Purpose: Exception for internal invariant violations in the type algebra and scope model.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Reported as "tyflow: internal error:". Raised when a caller
 *   hands a component a state that an upstream step should already have filtered
 *   (e.g. a nested union reaching UnionType::add). Library code never catches it.
 */
#pragma once

#include "tyflow/exceptions/tyflow_exception.h"

#include <string>
#include <utility>

namespace tyflow {
namespace exceptions {

class InvariantError : public TyflowException {
 public:
  explicit InvariantError(std::string msg) noexcept : TyflowException(Category::Invariant, std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace tyflow
