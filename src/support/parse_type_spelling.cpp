/***
 * Name: tyflow::support::ParseTypeSpelling
 * Purpose: Parse one command-line type spelling into a Ty.
 * Inputs:
 *   - text: spelling (surrounding whitespace ignored)
 *   - arena: owner of interned string and bigint atoms
 * Outputs:
 *   - Ty value; throws exceptions::ConfigError when the spelling is not recognized.
 * Theory of Operation: Keyword table first, then literal forms: quoted
 *   strings, bigint (`n` suffix), decimal numbers.
 */
#include "tyflow/support/type_spelling.h"

#include "ty/TypeArena.h"
#include "tyflow/exceptions/config_error.h"

#include <array>
#include <cctype>
#include <charconv>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace tyflow::support {

namespace {

constexpr std::array<std::pair<std::string_view, ty::TyKind>, 12> kKeywords{{
    {"string", ty::TyKind::String},
    {"number", ty::TyKind::Number},
    {"bigint", ty::TyKind::BigInt},
    {"boolean", ty::TyKind::Boolean},
    {"symbol", ty::TyKind::Symbol},
    {"object", ty::TyKind::Object},
    {"void", ty::TyKind::Void},
    {"null", ty::TyKind::Null},
    {"undefined", ty::TyKind::Undefined},
    {"any", ty::TyKind::Any},
    {"unknown", ty::TyKind::Unknown},
    {"never", ty::TyKind::Never},
}};

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) text.remove_suffix(1);
  return text;
}

bool IsIntegerText(std::string_view text) {
  if (!text.empty() && text[0] == '-') text.remove_prefix(1);
  if (text.empty()) return false;
  for (char ch : text) {
    if (std::isdigit(static_cast<unsigned char>(ch)) == 0) return false;
  }
  return true;
}

// Canonical decimal form: no leading zeros, no sign on zero.
std::string CanonicalBigInt(std::string_view digits) {
  const bool negative = !digits.empty() && digits[0] == '-';
  if (negative) digits.remove_prefix(1);
  const auto nonZero = digits.find_first_not_of('0');
  if (nonZero == std::string_view::npos) return "0";
  std::string out = negative ? "-" : "";
  out.append(digits.substr(nonZero));
  return out;
}

}  // namespace

ty::Ty ParseTypeSpelling(std::string_view text, ty::TypeArena& arena) {
  text = Trim(text);
  if (text.empty()) {
    throw exceptions::ConfigError("empty type spelling");
  }
  for (const auto& [word, kind] : kKeywords) {
    if (text == word) return ty::Ty::of(kind);
  }
  if (text == "true") return ty::Ty::booleanLiteral(true);
  if (text == "false") return ty::Ty::booleanLiteral(false);

  const char quote = text.front();
  if (quote == '\'' || quote == '"') {
    if (text.size() < 2 || text.back() != quote) {
      throw exceptions::ConfigError("unterminated string literal in type spelling: " + std::string(text));
    }
    return ty::Ty::stringLiteral(arena.intern(text.substr(1, text.size() - 2)));
  }

  if (text.back() == 'n' && IsIntegerText(text.substr(0, text.size() - 1))) {
    return ty::Ty::bigintLiteral(arena.intern(CanonicalBigInt(text.substr(0, text.size() - 1))));
  }

  double value = 0.0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec == std::errc{} && ptr == last) {
    return ty::Ty::numericLiteral(value);
  }
  throw exceptions::ConfigError("unknown type spelling '" + std::string(text) + "'");
}

}  // namespace tyflow::support
