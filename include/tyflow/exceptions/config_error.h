/***
 * Name: tyflow::exceptions::ConfigError
 * Purpose: Exception for configuration and option errors.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Reported as "tyflow: error:"; the message names the
 *   offending flag or spelling.
 */
#pragma once

#include "tyflow/exceptions/tyflow_exception.h"

#include <string>
#include <utility>

namespace tyflow {
namespace exceptions {

class ConfigError : public TyflowException {
 public:
  explicit ConfigError(std::string msg) noexcept : TyflowException(Category::Config, std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace tyflow
