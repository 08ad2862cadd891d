#pragma once

#include <string>
#include <string_view>

namespace notegraph::common {

/// Decode UTF-8 into code points. Invalid bytes decode to U+FFFD.
[[nodiscard]] std::u32string utf8_decode(std::string_view text);
[[nodiscard]] std::string utf8_encode(std::u32string_view text);

/// Simple (one-to-one) Unicode lowercasing through the UTF-8 C locale's wide ctype.
[[nodiscard]] std::u32string unicode_lower(std::u32string text);
[[nodiscard]] std::string utf8_lower(std::string_view text);
[[nodiscard]] bool is_unicode_space(char32_t cp);
[[nodiscard]] std::u32string trim_code_points(std::u32string_view text);

[[nodiscard]] inline bool is_hangul_syllable(const char32_t cp) {
  return cp >= 0xAC00 && cp <= 0xD7A3;
}

} // namespace notegraph::common
