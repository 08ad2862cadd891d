#pragma once

#include "notegraph/observability/observer.hpp"

#include <memory>

namespace notegraph::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_graph_analyzed(const std::string &notes_dir, std::size_t note_count,
                           std::chrono::milliseconds duration, bool from_cache);
void record_cache_hit(const std::string &key);
void record_cache_miss(const std::string &key, const std::string &reason);
void record_cache_invalidated(const std::string &file, const std::vector<std::string> &keys);
void record_clustering(std::size_t input_size, std::size_t clusters, bool truncated);
void record_links_merged(std::size_t files_modified, std::size_t links_replaced);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace notegraph::observability
