/***
 * Name: tyflow::support::ParseTypeList
 * Purpose: Parse every spelling argument into union members.
 * Inputs:
 *   - spellings: raw arguments, each possibly `a|b|c`
 *   - arena: owner of interned atoms
 * Outputs:
 *   - Members in argument order; throws exceptions::ConfigError on a bad member.
 * Theory of Operation: Splits on '|' outside quotes so `'a|b'` stays one literal.
 */
#include "tyflow/support/type_spelling.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tyflow::support {

std::vector<ty::Ty> ParseTypeList(const std::vector<std::string>& spellings, ty::TypeArena& arena) {
  std::vector<ty::Ty> members;
  for (const auto& spelling : spellings) {
    const std::string_view text{spelling};
    char quote = '\0';
    std::size_t start = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
      const char ch = text[i];
      if (quote != '\0') {
        if (ch == quote) quote = '\0';
      } else if (ch == '\'' || ch == '"') {
        quote = ch;
      } else if (ch == '|') {
        members.push_back(ParseTypeSpelling(text.substr(start, i - start), arena));
        start = i + 1;
      }
    }
    members.push_back(ParseTypeSpelling(text.substr(start), arena));
  }
  return members;
}

}  // namespace tyflow::support
