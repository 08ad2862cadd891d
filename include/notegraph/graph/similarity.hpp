#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace notegraph::graph {

inline constexpr double DEFAULT_SIMILARITY_THRESHOLD = 0.7;

struct SimilarityScore {
  double score = 0.0;
  double jaro_winkler = 0.0;
  double ngram = 0.0;
  double token_overlap = 0.0;
  double containment = 0.0;
};

/// All measures work on Unicode code points.
[[nodiscard]] double jaro_winkler_similarity(const std::string &s1, const std::string &s2,
                                             double prefix_scale = 0.1);
[[nodiscard]] double ngram_similarity(const std::string &s1, const std::string &s2,
                                      std::size_t n = 2);
[[nodiscard]] double token_overlap_similarity(const std::string &s1, const std::string &s2);
[[nodiscard]] double containment_similarity(const std::string &s1, const std::string &s2);

[[nodiscard]] SimilarityScore calculate_similarity(const std::string &s1, const std::string &s2);
[[nodiscard]] bool is_similar(const std::string &s1, const std::string &s2,
                              double threshold = DEFAULT_SIMILARITY_THRESHOLD);

[[nodiscard]] std::vector<std::string> similarity_tokens(const std::string &text);

struct SimilarPair {
  std::size_t first = 0;
  std::size_t second = 0;
  SimilarityScore similarity;
};

[[nodiscard]] std::vector<SimilarPair> find_similar_pairs(const std::vector<std::string> &strings,
                                                          double threshold = DEFAULT_SIMILARITY_THRESHOLD);

} // namespace notegraph::graph
