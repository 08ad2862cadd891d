#include "notegraph/graph/frontmatter.hpp"

#include "notegraph/common/fs.hpp"

namespace notegraph::graph {

namespace {

std::string strip_line_ending(std::string line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

std::string unquote(const std::string &value) {
  if (value.size() >= 2) {
    const char first = value.front();
    const char last = value.back();
    if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
      return value.substr(1, value.size() - 2);
    }
  }
  return value;
}

bool is_fence(const std::string &line) { return common::trim_end(line) == "---"; }

} // namespace

std::optional<std::string> FrontMatter::get(const std::string &key) const {
  const auto it = fields.find(key);
  if (it == fields.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second;
}

FrontMatter parse_front_matter(const std::string &content) {
  FrontMatter result;
  result.body = content;

  std::size_t offset = 0;
  if (common::starts_with(content, "\xEF\xBB\xBF")) {
    offset = 3;
  }

  std::size_t line_end = content.find('\n', offset);
  if (line_end == std::string::npos ||
      !is_fence(strip_line_ending(content.substr(offset, line_end - offset)))) {
    return result;
  }

  std::map<std::string, std::string> fields;
  std::size_t cursor = line_end + 1;
  while (cursor <= content.size()) {
    line_end = content.find('\n', cursor);
    const bool last_line = line_end == std::string::npos;
    const std::string line =
        strip_line_ending(content.substr(cursor, last_line ? std::string::npos : line_end - cursor));

    if (is_fence(line)) {
      result.present = true;
      result.fields = std::move(fields);
      result.body = last_line ? std::string() : content.substr(line_end + 1);
      return result;
    }

    // Indented lines belong to a nested value or list; only top-level scalars are kept.
    if (!line.empty() && line.front() != ' ' && line.front() != '\t' && line.front() != '#') {
      const auto colon = line.find(':');
      if (colon != std::string::npos) {
        const std::string key = common::trim(line.substr(0, colon));
        const std::string value = unquote(common::trim(line.substr(colon + 1)));
        if (!key.empty()) {
          fields[key] = value;
        }
      }
    }

    if (last_line) {
      break;
    }
    cursor = line_end + 1;
  }

  return result;
}

} // namespace notegraph::graph
