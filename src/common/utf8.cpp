#include "notegraph/common/utf8.hpp"

#include <locale>
#include <stdexcept>

namespace notegraph::common {

namespace {

constexpr char32_t REPLACEMENT = 0xFFFD;

// The classic "C" locale maps ASCII only; case mapping needs a UTF-8 ctype.
const std::locale &case_mapping_locale() {
  static const std::locale locale = [] {
    for (const char *name : {"C.UTF-8", "C.utf8", "en_US.UTF-8", ""}) {
      try {
        return std::locale(name);
      } catch (const std::runtime_error &) {
        // Not installed on this host; try the next name.
      }
    }
    return std::locale::classic();
  }();
  return locale;
}

} // namespace

std::u32string utf8_decode(const std::string_view text) {
  std::u32string out;
  out.reserve(text.size());

  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t extra = 0;
    char32_t cp = 0;
    if (lead < 0x80) {
      cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
      cp = lead & 0x1F;
      extra = 1;
    } else if ((lead & 0xF0) == 0xE0) {
      cp = lead & 0x0F;
      extra = 2;
    } else if ((lead & 0xF8) == 0xF0) {
      cp = lead & 0x07;
      extra = 3;
    } else {
      out.push_back(REPLACEMENT);
      ++i;
      continue;
    }

    if (i + extra >= text.size()) {
      out.push_back(REPLACEMENT);
      ++i;
      continue;
    }

    bool valid = true;
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cont = static_cast<unsigned char>(text[i + k]);
      if ((cont & 0xC0) != 0x80) {
        valid = false;
        break;
      }
      cp = (cp << 6) | (cont & 0x3F);
    }

    if (!valid) {
      out.push_back(REPLACEMENT);
      ++i;
      continue;
    }

    out.push_back(cp);
    i += extra + 1;
  }

  return out;
}

std::string utf8_encode(const std::u32string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char32_t cp : text) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }
  return out;
}

std::u32string unicode_lower(std::u32string text) {
  const auto &ctype = std::use_facet<std::ctype<wchar_t>>(case_mapping_locale());
  for (char32_t &cp : text) {
    if (cp < 0x80) {
      if (cp >= U'A' && cp <= U'Z') {
        cp = cp - U'A' + U'a';
      }
      continue;
    }
    cp = static_cast<char32_t>(ctype.tolower(static_cast<wchar_t>(cp)));
  }
  return text;
}

std::string utf8_lower(const std::string_view text) {
  return utf8_encode(unicode_lower(utf8_decode(text)));
}

bool is_unicode_space(const char32_t cp) {
  switch (cp) {
  case U' ':
  case U'\t':
  case U'\n':
  case U'\v':
  case U'\f':
  case U'\r':
  case 0x00A0:
  case 0x1680:
  case 0x2028:
  case 0x2029:
  case 0x202F:
  case 0x205F:
  case 0x3000:
  case 0xFEFF:
    return true;
  default:
    return cp >= 0x2000 && cp <= 0x200A;
  }
}

std::u32string trim_code_points(const std::u32string_view text) {
  std::size_t first = 0;
  std::size_t last = text.size();
  while (first < last && is_unicode_space(text[first])) {
    ++first;
  }
  while (last > first && is_unicode_space(text[last - 1])) {
    --last;
  }
  return std::u32string(text.substr(first, last - first));
}

} // namespace notegraph::common
