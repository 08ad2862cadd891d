#include "notegraph/graph/cluster.hpp"

#include "notegraph/common/hash.hpp"
#include "notegraph/graph/union_find.hpp"
#include "notegraph/observability/global.hpp"

#include <algorithm>

namespace notegraph::graph {

namespace {

/// Upper-triangle pairwise scores for `n` items, `i < j`.
class PairwiseTable {
public:
  explicit PairwiseTable(const std::size_t n) : n_(n), scores_(n < 2 ? 0 : n * (n - 1) / 2, 0.0) {}

  [[nodiscard]] double &at(std::size_t i, std::size_t j) {
    if (i > j) {
      std::swap(i, j);
    }
    return scores_[i * (2 * n_ - i - 1) / 2 + (j - i - 1)];
  }

private:
  std::size_t n_;
  std::vector<double> scores_;
};

std::size_t source_total(const DanglingLink &link) { return link.total_occurrences(); }

/// Most referenced first, then most referencing notes, then alphabetical.
bool ranks_before(const DanglingLink &a, const DanglingLink &b) {
  const std::size_t count_a = source_total(a);
  const std::size_t count_b = source_total(b);
  if (count_a != count_b) {
    return count_a > count_b;
  }
  if (a.sources.size() != b.sources.size()) {
    return a.sources.size() > b.sources.size();
  }
  return a.target < b.target;
}

std::string cluster_id(std::vector<std::string> targets) {
  std::sort(targets.begin(), targets.end());
  std::string joined;
  for (const auto &target : targets) {
    joined += target;
    joined.push_back('\n');
  }
  return "cluster-" + common::short_content_hash(joined);
}

std::vector<const DanglingLink *> select_inputs(const std::vector<DanglingLink> &links,
                                                const ClusterOptions &options, bool &truncated) {
  std::vector<const DanglingLink *> selected;
  selected.reserve(links.size());
  for (const auto &link : links) {
    selected.push_back(&link);
  }

  truncated = false;
  if (options.allow_large_input || selected.size() <= options.max_input) {
    return selected;
  }

  std::sort(selected.begin(), selected.end(),
            [](const DanglingLink *a, const DanglingLink *b) { return ranks_before(*a, *b); });
  selected.resize(options.max_input);
  truncated = true;
  observability::record_warning(
      "cluster", "clustering limited to the " + std::to_string(options.max_input) +
                     " most referenced of " + std::to_string(links.size()) + " dangling links");
  return selected;
}

} // namespace

ClusterReport cluster_dangling_links_report(const std::vector<DanglingLink> &links,
                                            const ClusterOptions &options) {
  ClusterReport report;
  const auto inputs = select_inputs(links, options, report.truncated);
  const std::size_t n = inputs.size();
  report.considered = n;
  if (n < 2) {
    observability::record_clustering(n, 0, report.truncated);
    return report;
  }

  UnionFind sets(n);
  PairwiseTable table(n);
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = i + 1; j < n; ++j) {
      const double score = calculate_similarity(inputs[i]->target, inputs[j]->target).score;
      table.at(i, j) = score;
      if (score >= options.threshold) {
        sets.unite(i, j);
      }
    }
  }

  for (const auto &group : sets.groups()) {
    if (group.empty() || group.size() < options.min_cluster_size) {
      continue;
    }

    const std::size_t representative = *std::min_element(
        group.begin(), group.end(),
        [&inputs](std::size_t a, std::size_t b) { return ranks_before(*inputs[a], *inputs[b]); });

    SimilarLinkCluster cluster;
    cluster.representative_target = inputs[representative]->target;

    std::vector<std::string> targets;
    double similarity_sum = 0.0;
    std::size_t others = 0;
    for (const std::size_t index : group) {
      const DanglingLink &link = *inputs[index];
      SimilarLinkMember member{.target = link.target, .similarity = 1.0, .sources = link.sources};
      if (index != representative) {
        member.similarity = table.at(index, representative);
        similarity_sum += member.similarity;
        ++others;
      }
      cluster.total_occurrences += source_total(link);
      targets.push_back(link.target);
      cluster.members.push_back(std::move(member));
    }

    cluster.average_similarity = others > 0 ? similarity_sum / static_cast<double>(others) : 1.0;
    const std::string &rep_target = cluster.representative_target;
    std::stable_sort(cluster.members.begin(), cluster.members.end(),
                     [&rep_target](const SimilarLinkMember &a, const SimilarLinkMember &b) {
                       const bool a_rep = a.target == rep_target;
                       const bool b_rep = b.target == rep_target;
                       if (a_rep != b_rep) {
                         return a_rep;
                       }
                       if (a.similarity != b.similarity) {
                         return a.similarity > b.similarity;
                       }
                       return a.target < b.target;
                     });
    cluster.id = cluster_id(std::move(targets));
    report.clusters.push_back(std::move(cluster));
  }

  std::sort(report.clusters.begin(), report.clusters.end(),
            [](const SimilarLinkCluster &a, const SimilarLinkCluster &b) {
              if (a.total_occurrences != b.total_occurrences) {
                return a.total_occurrences > b.total_occurrences;
              }
              return a.representative_target < b.representative_target;
            });
  if (report.clusters.size() > options.max_results) {
    report.clusters.resize(options.max_results);
  }

  observability::record_clustering(n, report.clusters.size(), report.truncated);
  return report;
}

std::vector<SimilarLinkCluster> cluster_dangling_links(const std::vector<DanglingLink> &links,
                                                       const ClusterOptions &options) {
  return cluster_dangling_links_report(links, options).clusters;
}

std::vector<SimilarDanglingLink> find_similar_dangling_links(const std::string &target,
                                                             const std::vector<DanglingLink> &links,
                                                             const double threshold) {
  std::vector<SimilarDanglingLink> results;
  for (const auto &link : links) {
    if (link.target == target) {
      continue;
    }
    auto similarity = calculate_similarity(target, link.target);
    if (similarity.score >= threshold) {
      results.push_back(SimilarDanglingLink{.dangling_link = link, .similarity = similarity});
    }
  }
  std::stable_sort(results.begin(), results.end(),
                   [](const SimilarDanglingLink &a, const SimilarDanglingLink &b) {
                     return a.similarity.score > b.similarity.score;
                   });
  return results;
}

} // namespace notegraph::graph
