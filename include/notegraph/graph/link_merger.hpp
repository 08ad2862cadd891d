#pragma once

#include "notegraph/common/result.hpp"
#include "notegraph/graph/analyzer.hpp"

#include <cstddef>
#include <map>
#include <regex>
#include <string>
#include <vector>

namespace notegraph::graph {

struct MergeLinkRequest {
  std::vector<std::string> old_targets;
  std::string new_target;
  bool preserve_as_alias = false;
};

struct MergeLinkResult {
  std::size_t files_modified = 0;
  std::size_t links_replaced = 0;
  std::vector<std::string> modified_files;
  /// File path -> failure message; other files are still processed.
  std::map<std::string, std::string> errors;
};

struct MergePreviewMatch {
  std::string original;
  std::string replaced;
  std::size_t line = 0;
};

struct MergePreviewFile {
  std::string file_path;
  std::vector<MergePreviewMatch> matches;
};

struct LinkReplacement {
  std::string content;
  std::size_t count = 0;
};

[[nodiscard]] common::Result<std::regex>
build_replacement_regex(const std::vector<std::string> &targets);

[[nodiscard]] common::Result<LinkReplacement> replace_links(const std::string &content,
                                                            const MergeLinkRequest &request);

class LinkMerger {
public:
  explicit LinkMerger(NoteGraphAnalyzer &analyzer);

  [[nodiscard]] common::Result<MergeLinkResult> merge(const std::string &notes_dir,
                                                      const MergeLinkRequest &request);
  [[nodiscard]] common::Result<std::vector<MergePreviewFile>>
  preview(const std::string &notes_dir, const MergeLinkRequest &request);

private:
  NoteGraphAnalyzer &analyzer_;
};

} // namespace notegraph::graph
