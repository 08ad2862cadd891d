#include "bench_common.hpp"

#include "notegraph/graph/analyzer.hpp"
#include "notegraph/graph/pagerank.hpp"

#include <filesystem>
#include <fstream>
#include <random>

namespace {

std::filesystem::path make_temp_dir() {
  static std::mt19937_64 rng{std::random_device{}()};
  const auto base = std::filesystem::temp_directory_path() /
                    ("notegraph-graph-bench-" + std::to_string(rng()));
  std::filesystem::create_directories(base);
  return base;
}

/// Each note links to its two successors and to one missing note.
void write_notes(const std::filesystem::path &dir, const int count) {
  for (int i = 0; i < count; ++i) {
    std::ofstream out(dir / ("note-" + std::to_string(i) + ".md"));
    out << "# Note " << i << "\n";
    out << "See [[note-" << (i + 1) % count << "]] and [[note-" << (i + 2) % count
        << "|next]].\n";
    out << "Also [[missing-" << i % 17 << "]].\n";
  }
}

} // namespace

void run_graph_benchmarks() {
  std::cout << "\n=== Graph Benchmarks ===\n";

  const auto dir = make_temp_dir();
  write_notes(dir, 500);
  const std::string notes_dir = dir.string();
  const auto fs = notegraph::graph::make_local_file_system();

  notegraph::bench::run_bench("analyze_uncached_500", 10, [&] {
    notegraph::graph::NoteGraphAnalyzer analyzer(fs, nullptr);
    (void)analyzer.analyze(notes_dir);
  });

  auto cache = std::make_shared<notegraph::graph::GraphCache>(fs);
  notegraph::graph::NoteGraphAnalyzer cached(fs, cache);
  (void)cached.analyze(notes_dir);
  notegraph::bench::run_bench("analyze_cached_500", 50, [&] {
    (void)cached.analyze(notes_dir);
  });

  const auto stats = cached.analyze(notes_dir);
  notegraph::bench::run_bench("pagerank_500", 20, [&] {
    (void)notegraph::graph::calculate_page_rank(stats);
  });

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}
