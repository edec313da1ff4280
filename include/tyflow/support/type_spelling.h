/***
 * Name: tyflow::support (type spellings)
 * Purpose: Turn command-line type spellings into Ty values.
 * Inputs: Spelling text such as `string`, `'a'`, `42`, `7n`, `null`, `a|b`.
 * Outputs: Ty values whose atoms live in the given TypeArena.
 * Theory of Operation: Keywords map to simple kinds; quoted text, numbers,
 *   bigint (`n` suffix) and true/false map to literal kinds. Throws
 *   exceptions::ConfigError for anything else.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "ty/Ty.h"

namespace tyflow::ty { class TypeArena; }

namespace tyflow {
namespace support {

/*** ParseTypeSpelling: Parse exactly one member spelling. */
ty::Ty ParseTypeSpelling(std::string_view text, ty::TypeArena& arena);

/*** ParseTypeList: Parse every argument, splitting each one on '|'. */
std::vector<ty::Ty> ParseTypeList(const std::vector<std::string>& spellings, ty::TypeArena& arena);

}  // namespace support
}  // namespace tyflow
