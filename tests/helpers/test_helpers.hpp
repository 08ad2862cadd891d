#pragma once

#include "notegraph/graph/file_system.hpp"
#include "notegraph/observability/observer.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace notegraph::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] std::string dir() const { return path_.string(); }
  /// Returns the created file's path.
  std::string create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// Thread-safe in-memory notes tree. Every write bumps a logical mtime.
class InMemoryFileSystem final : public graph::IFileSystem {
public:
  void set_file(const std::string &path, const std::string &content);
  /// New mtime, same bytes.
  void touch(const std::string &path);
  void remove_file(const std::string &path);
  void add_directory(const std::string &path);
  void set_unreadable(const std::string &path, bool unreadable = true);
  void set_unwritable(const std::string &path, bool unwritable = true);

  [[nodiscard]] std::string content(const std::string &path) const;
  [[nodiscard]] std::size_t read_count() const;
  [[nodiscard]] std::size_t read_count(const std::string &path) const;
  void reset_read_counts();

  [[nodiscard]] bool is_directory(const std::string &path) const override;
  [[nodiscard]] common::Result<std::vector<graph::DirEntry>>
  list_directory(const std::string &path) const override;
  [[nodiscard]] common::Result<std::string> read_file(const std::string &path) const override;
  [[nodiscard]] common::Status write_file(const std::string &path,
                                          const std::string &content) override;
  [[nodiscard]] common::Result<std::int64_t> modified_time(const std::string &path) const override;

private:
  struct File {
    std::string content;
    std::int64_t mtime = 0;
  };

  mutable std::mutex mutex_;
  std::map<std::string, File> files_;
  std::set<std::string> directories_;
  std::set<std::string> unreadable_;
  std::set<std::string> unwritable_;
  mutable std::map<std::string, std::size_t> reads_;
  std::int64_t clock_ = 1;
};

/// Keeps every event for later inspection.
class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;

  template <typename T> [[nodiscard]] std::size_t count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto &event : events_) {
      if (std::holds_alternative<T>(event)) {
        ++n;
      }
    }
    return n;
  }

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Installs a RecordingObserver as the global observer for one scope.
class ScopedRecordingObserver {
public:
  ScopedRecordingObserver();
  ~ScopedRecordingObserver();

  ScopedRecordingObserver(const ScopedRecordingObserver &) = delete;
  ScopedRecordingObserver &operator=(const ScopedRecordingObserver &) = delete;

  RecordingObserver &operator*() const { return *observer_; }
  RecordingObserver *operator->() const { return observer_; }

private:
  RecordingObserver *observer_ = nullptr;
};

} // namespace notegraph::testing
