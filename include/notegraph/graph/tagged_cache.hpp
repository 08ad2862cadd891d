#pragma once

#include "notegraph/graph/incremental_cache.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace notegraph::graph {

struct TaggedCacheStats {
  std::size_t size = 0;
  std::vector<std::string> keys;
  std::optional<std::chrono::milliseconds> oldest_age;
};

/// TTL cache keyed by `"type:identifier"` with an optional opaque hash per entry.
template <typename T> class TaggedCache {
public:
  explicit TaggedCache(IncrementalCacheOptions options = {})
      : store_(make_local_file_system(), std::move(options)) {}

  [[nodiscard]] static std::string make_key(const std::string &type, const std::string &identifier) {
    return type + ":" + identifier;
  }

  [[nodiscard]] std::optional<T> get(const std::string &type, const std::string &identifier) {
    const std::string key = make_key(type, identifier);
    auto value = store_.get(key);
    if (!value.has_value()) {
      hashes_.erase(key);
    }
    return value;
  }

  void set(const std::string &type, const std::string &identifier, T data,
           std::optional<std::string> hash = std::nullopt) {
    const std::string key = make_key(type, identifier);
    store_.set(key, std::move(data), {});
    hashes_.insert_or_assign(key, std::move(hash));
  }

  void invalidate(const std::string &type, const std::string &identifier) {
    const std::string key = make_key(type, identifier);
    store_.remove(key);
    hashes_.erase(key);
  }

  void invalidate_by_type(const std::string &type) {
    const std::string prefix = type + ":";
    for (const auto &key : store_.stats().keys) {
      if (key.compare(0, prefix.size(), prefix) == 0) {
        store_.remove(key);
        hashes_.erase(key);
      }
    }
  }

  void clear() {
    store_.clear();
    hashes_.clear();
  }

  std::size_t cleanup_expired() {
    const std::size_t removed = store_.cleanup_expired();
    std::erase_if(hashes_, [this](const auto &item) { return !store_.contains(item.first); });
    return removed;
  }

  [[nodiscard]] bool is_valid(const std::string &type, const std::string &identifier,
                              const std::string &current_hash) const {
    const std::string key = make_key(type, identifier);
    const auto created = store_.created_at(key);
    if (!created.has_value() || store_.now() - *created >= store_.ttl()) {
      return false;
    }
    const auto it = hashes_.find(key);
    return it == hashes_.end() || !it->second.has_value() || *it->second == current_hash;
  }

  [[nodiscard]] TaggedCacheStats stats() const {
    TaggedCacheStats stats;
    stats.keys = store_.stats().keys;
    stats.size = stats.keys.size();
    const auto now = store_.now();
    for (const auto &key : stats.keys) {
      const auto created = store_.created_at(key);
      if (!created.has_value()) {
        continue;
      }
      const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - *created);
      if (!stats.oldest_age.has_value() || age > *stats.oldest_age) {
        stats.oldest_age = age;
      }
    }
    return stats;
  }

private:
  IncrementalCache<T> store_;
  std::map<std::string, std::optional<std::string>> hashes_;
};

} // namespace notegraph::graph
