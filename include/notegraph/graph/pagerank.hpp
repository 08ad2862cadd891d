#pragma once

#include "notegraph/graph/types.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace notegraph::graph {

struct PageRankOptions {
  double damping = 0.85;
  std::size_t iterations = 20;
  /// Stop once the L1 distance between successive score vectors drops below this.
  double tolerance = 1e-6;
};

struct PageRankResult {
  std::map<std::string, double> scores;
  std::map<std::string, double> title_scores;
  std::size_t iterations = 0;
  bool converged = false;
};

[[nodiscard]] PageRankResult
calculate_page_rank(const std::map<std::string, std::vector<std::string>> &forward_links,
                    const std::map<std::string, std::vector<BacklinkEntry>> &backlinks,
                    const PageRankOptions &options = {},
                    const std::vector<NoteMetadata> &notes = {});

[[nodiscard]] PageRankResult calculate_page_rank(const NoteGraphStats &stats,
                                                 const PageRankOptions &options = {});

[[nodiscard]] double page_rank_score(const std::map<std::string, double> &scores,
                                     const std::string &note_path);

} // namespace notegraph::graph
