#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace notegraph::observability {

struct GraphAnalyzedEvent {
  std::string notes_dir;
  std::size_t note_count = 0;
  std::chrono::milliseconds duration{0};
  bool from_cache = false;
};

struct CacheHitEvent {
  std::string key;
};

struct CacheMissEvent {
  std::string key;
  std::string reason;
};

struct CacheInvalidatedEvent {
  std::string file;
  std::vector<std::string> keys;
};

struct ClusteringEvent {
  std::size_t input_size = 0;
  std::size_t clusters = 0;
  bool truncated = false;
};

struct LinksMergedEvent {
  std::size_t files_modified = 0;
  std::size_t links_replaced = 0;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<GraphAnalyzedEvent, CacheHitEvent, CacheMissEvent, CacheInvalidatedEvent,
                 ClusteringEvent, LinksMergedEvent, WarningEvent, ErrorEvent>;

struct AnalysisLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct CacheSizeMetric {
  std::uint64_t entries = 0;
  std::uint64_t tracked_files = 0;
};

struct HashComputationsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<AnalysisLatencyMetric, CacheSizeMetric, HashComputationsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace notegraph::observability
