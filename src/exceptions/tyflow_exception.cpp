/***
 * Name: tyflow::exceptions::TyflowException (definitions)
 * Purpose: Message storage and category labels.
 */
#include "tyflow/exceptions/tyflow_exception.h"

#include <utility>

namespace tyflow::exceptions {

TyflowException::TyflowException(Category category, std::string msg) noexcept
    : category_(category), message_(std::move(msg)) {}

const char* TyflowException::what() const noexcept { return message_.c_str(); }

std::string_view TyflowException::label() const noexcept {
  return category_ == Category::Invariant ? "internal error" : "error";
}

}  // namespace tyflow::exceptions
