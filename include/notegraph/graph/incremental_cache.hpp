#pragma once

#include "notegraph/graph/fingerprint.hpp"
#include "notegraph/observability/global.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace notegraph::graph {

inline constexpr std::chrono::milliseconds DEFAULT_CACHE_TTL = std::chrono::minutes(5);

class IFileInvalidationTarget {
public:
  virtual ~IFileInvalidationTarget() = default;

  virtual std::vector<std::string> invalidate_by_file(const std::string &path) = 0;
};

struct ValidationResult {
  bool valid = true;
  std::vector<std::string> changed_files;
};

using CacheValidator = std::function<ValidationResult()>;
using CacheClock = std::function<std::chrono::system_clock::time_point()>;

struct IncrementalCacheOptions {
  std::chrono::milliseconds ttl = DEFAULT_CACHE_TTL;
  CacheClock clock;
};

struct IncrementalCacheStats {
  std::size_t cache_size = 0;
  std::size_t file_hash_cache_size = 0;
  std::size_t tracked_files = 0;
  std::vector<std::string> keys;
};

/// Single owner; not safe for concurrent use.
template <typename T> class IncrementalCache final : public IFileInvalidationTarget {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  explicit IncrementalCache(std::shared_ptr<IFileSystem> fs, IncrementalCacheOptions options = {})
      : options_(std::move(options)), fingerprinter_(std::move(fs)) {}

  [[nodiscard]] std::optional<T> get(const std::string &key, const CacheValidator &validator = {}) {
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
      observability::record_cache_miss(key, "absent");
      return std::nullopt;
    }
    if (is_expired(it->second)) {
      erase_entry(key);
      observability::record_cache_miss(key, "expired");
      return std::nullopt;
    }

    for (auto &dependency : it->second.dependencies) {
      const auto check = fingerprinter_.check(dependency);
      if (check.state == DependencyState::Changed) {
        const std::string changed = dependency.path;
        erase_entry(key);
        observability::record_cache_miss(key, "dependency changed: " + changed);
        return std::nullopt;
      }
      if (check.state == DependencyState::Touched) {
        dependency.mtime = check.current_mtime;
      }
    }

    if (validator) {
      const auto result = validator();
      if (!result.valid) {
        std::string reason = "validator rejected";
        for (std::size_t i = 0; i < result.changed_files.size(); ++i) {
          reason += i == 0 ? ": " : ", ";
          reason += result.changed_files[i];
        }
        erase_entry(key);
        observability::record_cache_miss(key, reason);
        return std::nullopt;
      }
    }

    observability::record_cache_hit(key);
    return it->second.data;
  }

  void set(const std::string &key, T data, const std::vector<std::string> &dependencies) {
    unlink_dependents(key);

    Entry entry{.data = std::move(data), .created_at = now(), .dependencies = {}};
    entry.dependencies.reserve(dependencies.size());
    for (const auto &path : dependencies) {
      entry.dependencies.push_back(fingerprinter_.fingerprint(path));
      dependents_[path].insert(key);
    }
    entries_.insert_or_assign(key, std::move(entry));

    observability::record_metric(observability::CacheSizeMetric{
        .entries = entries_.size(), .tracked_files = dependents_.size()});
  }

  std::vector<std::string> invalidate_by_file(const std::string &path) override {
    std::vector<std::string> removed;
    if (const auto it = dependents_.find(path); it != dependents_.end()) {
      removed.assign(it->second.begin(), it->second.end());
    }
    for (const auto &key : removed) {
      erase_entry(key);
    }
    dependents_.erase(path);
    fingerprinter_.forget(path);

    if (!removed.empty()) {
      observability::record_cache_invalidated(path, removed);
    }
    return removed;
  }

  bool remove(const std::string &key) {
    if (!entries_.contains(key)) {
      return false;
    }
    erase_entry(key);
    return true;
  }

  void clear() {
    entries_.clear();
    dependents_.clear();
    fingerprinter_.clear();
  }

  std::size_t cleanup_expired() {
    std::vector<std::string> expired;
    for (const auto &[key, entry] : entries_) {
      if (is_expired(entry)) {
        expired.push_back(key);
      }
    }
    for (const auto &key : expired) {
      erase_entry(key);
    }
    return expired.size();
  }

  [[nodiscard]] IncrementalCacheStats stats() const {
    IncrementalCacheStats stats{.cache_size = entries_.size(),
                                .file_hash_cache_size = fingerprinter_.memo_size(),
                                .tracked_files = dependents_.size(),
                                .keys = {}};
    stats.keys.reserve(entries_.size());
    for (const auto &[key, entry] : entries_) {
      stats.keys.push_back(key);
    }
    return stats;
  }

  [[nodiscard]] std::vector<FileDependency> dependencies(const std::string &key) const {
    const auto it = entries_.find(key);
    return it == entries_.end() ? std::vector<FileDependency>{} : it->second.dependencies;
  }

  [[nodiscard]] bool contains(const std::string &key) const { return entries_.contains(key); }

  [[nodiscard]] std::optional<TimePoint> created_at(const std::string &key) const {
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->second.created_at;
  }

  [[nodiscard]] TimePoint now() const {
    return options_.clock ? options_.clock() : std::chrono::system_clock::now();
  }

  [[nodiscard]] std::chrono::milliseconds ttl() const { return options_.ttl; }
  [[nodiscard]] const FileFingerprinter &fingerprinter() const { return fingerprinter_; }
  void reset_counters() { fingerprinter_.reset_counters(); }

private:
  struct Entry {
    T data;
    TimePoint created_at;
    std::vector<FileDependency> dependencies;
  };

  [[nodiscard]] bool is_expired(const Entry &entry) const {
    return now() - entry.created_at >= options_.ttl;
  }

  void unlink_dependents(const std::string &key) {
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
      return;
    }
    for (const auto &dependency : it->second.dependencies) {
      const auto bucket = dependents_.find(dependency.path);
      if (bucket == dependents_.end()) {
        continue;
      }
      bucket->second.erase(key);
      if (bucket->second.empty()) {
        dependents_.erase(bucket);
      }
    }
  }

  void erase_entry(const std::string &key) {
    unlink_dependents(key);
    entries_.erase(key);
  }

  IncrementalCacheOptions options_;
  FileFingerprinter fingerprinter_;
  std::map<std::string, Entry> entries_;
  std::map<std::string, std::set<std::string>> dependents_;
};

} // namespace notegraph::graph
