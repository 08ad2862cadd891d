#pragma once

#include "notegraph/graph/types.hpp"

#include <string>
#include <vector>

namespace notegraph::graph {

[[nodiscard]] std::vector<Wikilink> parse_wikilinks(const std::string &content);

[[nodiscard]] std::vector<std::string> extract_wikilinks(const std::string &content);

[[nodiscard]] std::size_t count_wikilink_mentions(const std::string &content);

[[nodiscard]] std::vector<Wikilink> find_links_to_note(const std::string &content,
                                                       const std::string &target_note);

/// Surrounding text for display: up to `context_length` characters on either side,
/// "..." where truncated, newlines folded to spaces.
[[nodiscard]] std::string extract_context(const std::string &content, const Wikilink &link,
                                          std::size_t context_length = 50);

[[nodiscard]] std::string normalize_note_title(const std::string &title);
[[nodiscard]] bool is_same_note(const std::string &a, const std::string &b);

} // namespace notegraph::graph
