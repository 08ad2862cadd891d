#include "notegraph/graph/pagerank.hpp"

#include "notegraph/graph/file_system.hpp"
#include "notegraph/graph/wikilinks.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace notegraph::graph {

PageRankResult
calculate_page_rank(const std::map<std::string, std::vector<std::string>> &forward_links,
                    const std::map<std::string, std::vector<BacklinkEntry>> &backlinks,
                    const PageRankOptions &options, const std::vector<NoteMetadata> &notes) {
  PageRankResult result;
  const std::size_t n = forward_links.size();
  if (n == 0) {
    result.converged = true;
    return result;
  }

  std::vector<std::string> paths;
  std::vector<std::string> titles;
  std::unordered_map<std::string, std::size_t> index_of;
  std::vector<double> out_degree;
  paths.reserve(n);
  for (const auto &[path, targets] : forward_links) {
    index_of.emplace(path, paths.size());
    paths.push_back(path);
    out_degree.push_back(targets.empty() ? 1.0 : static_cast<double>(targets.size()));
  }

  std::unordered_map<std::string, std::string> title_by_path;
  for (const auto &note : notes) {
    if (!note.title.empty()) {
      title_by_path.emplace(note.path, note.title);
    }
  }
  for (const auto &path : paths) {
    const auto it = title_by_path.find(path);
    titles.push_back(it != title_by_path.end() ? it->second : note_basename(path));
  }

  // Incoming source indices per node, resolved once up front.
  std::unordered_map<std::string, std::vector<std::size_t>> sources_by_title;
  for (const auto &[title, entries] : backlinks) {
    auto &sources = sources_by_title[normalize_note_title(title)];
    for (const auto &entry : entries) {
      if (const auto it = index_of.find(entry.note_path); it != index_of.end()) {
        sources.push_back(it->second);
      }
    }
  }
  std::vector<std::vector<std::size_t>> incoming(n);
  for (std::size_t i = 0; i < n; ++i) {
    if (const auto it = sources_by_title.find(normalize_note_title(titles[i]));
        it != sources_by_title.end()) {
      incoming[i] = it->second;
    }
  }

  const double node_count = static_cast<double>(n);
  const double base = (1.0 - options.damping) / node_count;
  std::vector<double> scores(n, 1.0 / node_count);
  std::vector<double> next(n, 0.0);

  for (std::size_t iteration = 0; iteration < options.iterations; ++iteration) {
    result.iterations = iteration + 1;
    double delta = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
      double incoming_sum = 0.0;
      for (const std::size_t source : incoming[i]) {
        incoming_sum += scores[source] / out_degree[source];
      }
      next[i] = base + options.damping * incoming_sum;
      delta += std::fabs(next[i] - scores[i]);
    }
    scores.swap(next);
    if (delta < options.tolerance) {
      result.converged = true;
      break;
    }
  }

  const double max_score = *std::max_element(scores.begin(), scores.end());
  for (std::size_t i = 0; i < n; ++i) {
    const double normalized = max_score > 0.0 ? scores[i] / max_score : 1.0 / node_count;
    result.scores.emplace(paths[i], normalized);
    auto &title_score = result.title_scores[titles[i]];
    title_score = std::max(title_score, normalized);
  }
  return result;
}

PageRankResult calculate_page_rank(const NoteGraphStats &stats, const PageRankOptions &options) {
  return calculate_page_rank(stats.forward_links, stats.backlinks, options, stats.notes);
}

double page_rank_score(const std::map<std::string, double> &scores, const std::string &note_path) {
  const auto it = scores.find(note_path);
  return it == scores.end() ? 0.0 : it->second;
}

} // namespace notegraph::graph
