#pragma once

#include "notegraph/graph/similarity.hpp"
#include "notegraph/graph/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace notegraph::graph {

struct SimilarLinkMember {
  std::string target;
  double similarity = 1.0;
  std::vector<DanglingSource> sources;
};

struct SimilarLinkCluster {
  std::string id;
  std::string representative_target;
  std::vector<SimilarLinkMember> members;
  std::size_t total_occurrences = 0;
  double average_similarity = 1.0;
};

struct ClusterOptions {
  double threshold = DEFAULT_SIMILARITY_THRESHOLD;
  std::size_t min_cluster_size = 2;
  std::size_t max_results = 50;
  std::size_t max_input = 1000;
  bool allow_large_input = false;
};

struct ClusterReport {
  std::vector<SimilarLinkCluster> clusters;
  bool truncated = false;
  std::size_t considered = 0;
};

/// Groups dangling targets connected by pairs scoring at least `threshold`.
/// Membership is the transitive closure of those pairs, so two members need not
/// be similar to each other directly.
[[nodiscard]] ClusterReport cluster_dangling_links_report(const std::vector<DanglingLink> &links,
                                                          const ClusterOptions &options = {});

[[nodiscard]] std::vector<SimilarLinkCluster>
cluster_dangling_links(const std::vector<DanglingLink> &links, const ClusterOptions &options = {});

struct SimilarDanglingLink {
  DanglingLink dangling_link;
  SimilarityScore similarity;
};

[[nodiscard]] std::vector<SimilarDanglingLink>
find_similar_dangling_links(const std::string &target, const std::vector<DanglingLink> &links,
                            double threshold = DEFAULT_SIMILARITY_THRESHOLD);

} // namespace notegraph::graph
