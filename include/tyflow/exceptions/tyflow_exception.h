/***
 * Name: tyflow::exceptions::TyflowException
 * Purpose: Base class for every exception tyflow throws.
 * Inputs: A category and a message describing the failure
 * Outputs: Exception object providing `what()` text and a report label
 * Theory of Operation: Two kinds of failure leave the library. Config
 *   failures are the user's input (bad flags, bad type spellings). Invariant
 *   failures are defects in tyflow itself. main() prints them with different
 *   labels; precision loss in the algebra is data (Ty::Error), never an
 *   exception.
 */
#pragma once

#include <exception>
#include <string>
#include <string_view>

namespace tyflow {
namespace exceptions {

class TyflowException : public std::exception {
 public:
  enum class Category { Config, Invariant };

  const char* what() const noexcept override;
  Category category() const noexcept { return category_; }
  // "error" for user input, "internal error" for defects.
  std::string_view label() const noexcept;

 protected:
  TyflowException(Category category, std::string msg) noexcept;

 private:
  Category category_;
  std::string message_;
};

}  // namespace exceptions
}  // namespace tyflow
