/***
 * Name: tyflow::support::Utf16Length
 * Purpose: Count UTF-16 code units of a UTF-8 string.
 */
#include "tyflow/support/utf8.h"

#include <cstdint>

namespace tyflow::support {

static inline bool IsCont(std::uint8_t c) { return (c & 0xC0U) == 0x80U; }

std::optional<std::size_t> Utf16Length(std::string_view text) {
  const auto* s = reinterpret_cast<const std::uint8_t*>(text.data());
  const auto* end = s + text.size();
  std::size_t units = 0;
  while (s < end) {
    const std::uint8_t c = *s++;
    if (c < 0x80U) { ++units; continue; }
    if ((c >> 5U) == 0x6U) {  // 110xxxxx
      if (s >= end || !IsCont(*s)) return std::nullopt;
      if ((c & 0x1EU) == 0x0U) return std::nullopt;  // overlong
      s += 1;
      ++units;
    } else if ((c >> 4U) == 0xEU) {  // 1110xxxx
      if (end - s < 2 || !IsCont(s[0]) || !IsCont(s[1])) return std::nullopt;
      const std::uint32_t cp = ((c & 0x0FU) << 12U) | ((s[0] & 0x3FU) << 6U) | (s[1] & 0x3FU);
      if (cp < 0x800U || (cp >= 0xD800U && cp <= 0xDFFFU)) return std::nullopt;
      s += 2;
      ++units;
    } else if ((c >> 3U) == 0x1EU) {  // 11110xxx, outside the BMP: a surrogate pair
      if (end - s < 3 || !IsCont(s[0]) || !IsCont(s[1]) || !IsCont(s[2])) return std::nullopt;
      const std::uint32_t cp =
          ((c & 0x07U) << 18U) | ((s[0] & 0x3FU) << 12U) | ((s[1] & 0x3FU) << 6U) | (s[2] & 0x3FU);
      if (cp < 0x10000U || cp > 0x10FFFFU) return std::nullopt;
      s += 3;
      units += 2;
    } else {
      return std::nullopt;
    }
  }
  return units;
}

}  // namespace tyflow::support
