#include "bench_common.hpp"

#include "notegraph/graph/cluster.hpp"
#include "notegraph/graph/similarity.hpp"

#include <string>
#include <vector>

namespace {

std::vector<notegraph::graph::DanglingLink> make_links(const int count) {
  static const std::vector<std::string> stems = {"Machine Learning", "Quantum Physics",
                                                 "Graph Theory", "서울 여행", "Project Notes"};
  std::vector<notegraph::graph::DanglingLink> links;
  for (int i = 0; i < count; ++i) {
    std::string target = stems[static_cast<std::size_t>(i) % stems.size()];
    target += (i % 3 == 0) ? "" : (i % 3 == 1 ? "s" : " " + std::to_string(i));
    links.push_back(notegraph::graph::DanglingLink{
        .target = target,
        .sources = {notegraph::graph::DanglingSource{.note_id = "n" + std::to_string(i),
                                                     .note_path = "/notes/n.md",
                                                     .note_title = "n",
                                                     .count = 1}}});
  }
  return links;
}

} // namespace

void run_similarity_benchmarks() {
  std::cout << "\n=== Similarity Benchmarks ===\n";

  notegraph::bench::run_bench("calculate_similarity", 20000, [] {
    (void)notegraph::graph::calculate_similarity("Machine Learning", "machine-learning notes");
  });

  const auto links = make_links(300);
  notegraph::bench::run_bench("cluster_dangling_300", 5, [&] {
    (void)notegraph::graph::cluster_dangling_links(links);
  });
}
