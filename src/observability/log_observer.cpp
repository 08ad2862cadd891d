#include "notegraph/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace notegraph::observability {

namespace {

std::string join_keys(const std::vector<std::string> &keys) {
  std::string out;
  for (std::size_t i = 0; i < keys.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += keys[i];
  }
  return out;
}

} // namespace

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, GraphAnalyzedEvent>) {
          log_line("INFO", "graph.analyzed dir=" + evt.notes_dir +
                               " notes=" + std::to_string(evt.note_count) +
                               " duration_ms=" + std::to_string(evt.duration.count()) +
                               " cached=" + (evt.from_cache ? std::string("true")
                                                            : std::string("false")));
        } else if constexpr (std::is_same_v<T, CacheHitEvent>) {
          log_line("DEBUG", "cache.hit key=" + evt.key);
        } else if constexpr (std::is_same_v<T, CacheMissEvent>) {
          log_line("DEBUG", "cache.miss key=" + evt.key + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, CacheInvalidatedEvent>) {
          log_line("DEBUG", "cache.invalidated file=" + evt.file + " keys=" + join_keys(evt.keys));
        } else if constexpr (std::is_same_v<T, ClusteringEvent>) {
          log_line("INFO", "cluster.done input=" + std::to_string(evt.input_size) +
                               " clusters=" + std::to_string(evt.clusters) +
                               (evt.truncated ? " truncated=true" : ""));
        } else if constexpr (std::is_same_v<T, LinksMergedEvent>) {
          log_line("INFO", "links.merged files=" + std::to_string(evt.files_modified) +
                               " links=" + std::to_string(evt.links_replaced));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, AnalysisLatencyMetric>) {
          log_line("DEBUG", "metric.analysis_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, CacheSizeMetric>) {
          log_line("DEBUG", "metric.cache_entries=" + std::to_string(m.entries) +
                                " tracked_files=" + std::to_string(m.tracked_files));
        } else if constexpr (std::is_same_v<T, HashComputationsMetric>) {
          log_line("DEBUG", "metric.hash_computations=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() { out_.flush(); }

} // namespace notegraph::observability
