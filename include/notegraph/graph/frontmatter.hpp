#pragma once

#include <map>
#include <optional>
#include <string>

namespace notegraph::graph {

struct FrontMatter {
  bool present = false;
  std::map<std::string, std::string> fields;
  std::string body;

  [[nodiscard]] std::optional<std::string> get(const std::string &key) const;
};

/// Nested values and lists are skipped; malformed blocks yield `present == false`
/// and the whole content as body.
[[nodiscard]] FrontMatter parse_front_matter(const std::string &content);

} // namespace notegraph::graph
