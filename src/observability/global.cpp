#include "notegraph/observability/global.hpp"

#include <mutex>

namespace notegraph::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_graph_analyzed(const std::string &notes_dir, const std::size_t note_count,
                           const std::chrono::milliseconds duration, const bool from_cache) {
  record_event(GraphAnalyzedEvent{.notes_dir = notes_dir,
                                  .note_count = note_count,
                                  .duration = duration,
                                  .from_cache = from_cache});
}

void record_cache_hit(const std::string &key) { record_event(CacheHitEvent{.key = key}); }

void record_cache_miss(const std::string &key, const std::string &reason) {
  record_event(CacheMissEvent{.key = key, .reason = reason});
}

void record_cache_invalidated(const std::string &file, const std::vector<std::string> &keys) {
  record_event(CacheInvalidatedEvent{.file = file, .keys = keys});
}

void record_clustering(const std::size_t input_size, const std::size_t clusters,
                       const bool truncated) {
  record_event(
      ClusteringEvent{.input_size = input_size, .clusters = clusters, .truncated = truncated});
}

void record_links_merged(const std::size_t files_modified, const std::size_t links_replaced) {
  record_event(
      LinksMergedEvent{.files_modified = files_modified, .links_replaced = links_replaced});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace notegraph::observability
