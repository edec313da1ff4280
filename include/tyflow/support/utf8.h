/***
 * Name: tyflow::support (utf8)
 * Purpose: UTF-8 measurements used when folding string literal properties.
 * Inputs: Interned UTF-8 text
 * Outputs: Lengths in the units the scripting language reports
 * Theory of Operation: Strict decode; overlong forms, surrogates and
 *   truncated sequences are rejected rather than counted.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace tyflow {
namespace support {

/*** Utf16Length: UTF-16 code units of valid UTF-8 text; nullopt when the text is not valid UTF-8. */
std::optional<std::size_t> Utf16Length(std::string_view text);

}  // namespace support
}  // namespace tyflow
