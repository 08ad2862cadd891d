#include "notegraph/graph/wikilinks.hpp"

#include "notegraph/common/fs.hpp"
#include "notegraph/common/utf8.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <string_view>

namespace notegraph::graph {

namespace {

const std::regex &wikilink_regex() {
  static const std::regex pattern(R"(\[\[([^\]|#]+)(?:#([^\]|]+))?(?:\|([^\]]+))?\]\])");
  return pattern;
}

bool is_utf8_continuation(const char ch) {
  return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

std::size_t count_code_points(const std::string_view text) {
  return static_cast<std::size_t>(
      std::count_if(text.begin(), text.end(), [](const char ch) { return !is_utf8_continuation(ch); }));
}

// Byte offset of the code point at `index`; text.size() when past the end.
std::size_t byte_offset_of(const std::string_view text, const std::size_t index) {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (is_utf8_continuation(text[i])) {
      continue;
    }
    if (seen == index) {
      return i;
    }
    ++seen;
  }
  return text.size();
}

std::string collapse_newlines(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  bool in_newlines = false;
  for (const char ch : text) {
    if (ch == '\n') {
      if (!in_newlines) {
        out.push_back(' ');
      }
      in_newlines = true;
      continue;
    }
    in_newlines = false;
    out.push_back(ch);
  }
  return out;
}

} // namespace

std::size_t DanglingLink::total_occurrences() const {
  std::size_t total = 0;
  for (const auto &source : sources) {
    total += source.count;
  }
  return total;
}

std::vector<Wikilink> parse_wikilinks(const std::string &content) {
  std::vector<Wikilink> links;
  const auto &pattern = wikilink_regex();

  const std::string_view text(content);
  std::size_t line_start = 0;
  std::size_t line_start_chars = 0;
  std::size_t line_number = 0;
  while (line_start <= content.size()) {
    std::size_t line_end = content.find('\n', line_start);
    if (line_end == std::string::npos) {
      line_end = content.size();
    }

    const auto begin = content.begin() + static_cast<std::ptrdiff_t>(line_start);
    const auto end = content.begin() + static_cast<std::ptrdiff_t>(line_end);
    for (std::sregex_iterator it(begin, end, pattern), last; it != last; ++it) {
      const auto &match = *it;
      Wikilink link;
      link.raw = match.str(0);
      link.target = common::trim(match.str(1));
      if (match[2].matched) {
        link.section = common::trim(match.str(2));
      }
      if (match[3].matched) {
        link.alias = common::trim(match.str(3));
      }
      const auto offset = static_cast<std::size_t>(match.position(0));
      link.position.start = line_start_chars + count_code_points(text.substr(line_start, offset));
      link.position.end = link.position.start + count_code_points(link.raw);
      link.position.line = line_number;
      links.push_back(std::move(link));
    }

    if (line_end == content.size()) {
      break;
    }
    line_start_chars += count_code_points(text.substr(line_start, line_end - line_start)) + 1;
    line_start = line_end + 1;
    ++line_number;
  }

  return links;
}

std::vector<std::string> extract_wikilinks(const std::string &content) {
  std::vector<std::string> targets;
  for (auto &link : parse_wikilinks(content)) {
    if (std::find(targets.begin(), targets.end(), link.target) == targets.end()) {
      targets.push_back(std::move(link.target));
    }
  }
  return targets;
}

std::size_t count_wikilink_mentions(const std::string &content) {
  return parse_wikilinks(content).size();
}

std::vector<Wikilink> find_links_to_note(const std::string &content,
                                         const std::string &target_note) {
  const std::string wanted = normalize_note_title(target_note);
  auto links = parse_wikilinks(content);
  std::erase_if(links, [&wanted](const Wikilink &link) {
    return normalize_note_title(link.target) != wanted;
  });
  return links;
}

std::string extract_context(const std::string &content, const Wikilink &link,
                            const std::size_t context_length) {
  const std::size_t total = count_code_points(content);
  const std::size_t start =
      link.position.start > context_length ? link.position.start - context_length : 0;
  const std::size_t end = std::min(total, link.position.end + context_length);

  const std::size_t first_byte = start == 0 ? 0 : byte_offset_of(content, start);
  const std::size_t last_byte = byte_offset_of(content, end);
  std::string context = content.substr(first_byte, last_byte - first_byte);
  if (start > 0) {
    context = "..." + common::trim_start(context);
  }
  if (end < total) {
    context = common::trim_end(context) + "...";
  }

  return common::trim(collapse_newlines(context));
}

std::string normalize_note_title(const std::string &title) {
  std::string value = common::trim(common::utf8_lower(title));
  if (common::ends_with(value, ".md")) {
    value.resize(value.size() - 3);
  }

  std::string collapsed;
  collapsed.reserve(value.size());
  bool in_space = false;
  for (char ch : value) {
    if (ch == '-' || ch == '_') {
      ch = ' ';
    }
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      if (!in_space) {
        collapsed.push_back(' ');
      }
      in_space = true;
      continue;
    }
    in_space = false;
    collapsed.push_back(ch);
  }
  return collapsed;
}

bool is_same_note(const std::string &a, const std::string &b) {
  return normalize_note_title(a) == normalize_note_title(b);
}

} // namespace notegraph::graph
