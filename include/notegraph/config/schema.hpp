#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace notegraph::config {

struct GraphConfig {
  bool include_context = false;
  std::size_t context_length = 50;
  bool use_cache = true;
  std::size_t io_concurrency = 8;
};

struct CacheConfig {
  std::uint64_t ttl_seconds = 300;
};

struct ClusterConfig {
  double threshold = 0.7;
  std::size_t min_cluster_size = 2;
  std::size_t max_results = 50;
  std::size_t max_input = 1000;
  bool allow_large_input = false;
};

struct PageRankConfig {
  double damping = 0.85;
  std::size_t iterations = 20;
  double tolerance = 1e-6;
};

struct WatchConfig {
  std::uint64_t interval_ms = 1000;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::string notes_dir = "~/notes";
  GraphConfig graph;
  CacheConfig cache;
  ClusterConfig cluster;
  PageRankConfig pagerank;
  WatchConfig watch;
  ObservabilityConfig observability;
};

} // namespace notegraph::config
