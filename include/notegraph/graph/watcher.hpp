#pragma once

#include "notegraph/graph/file_system.hpp"
#include "notegraph/graph/incremental_cache.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace notegraph::graph {

enum class ChangeKind { Added, Modified, Removed };

[[nodiscard]] const char *change_kind_name(ChangeKind kind);

struct WatchChange {
  std::string path;
  ChangeKind kind = ChangeKind::Modified;
  std::vector<std::string> invalidated;
};

struct WatcherConfig {
  std::chrono::milliseconds poll_interval{1000};
};

/// Polls the mtimes of the notes under a directory and drops cache entries that
/// depend on any file that changed, appeared or vanished since the last poll.
class NoteWatcher {
public:
  using ChangeCallback = std::function<void(const std::vector<WatchChange> &)>;

  NoteWatcher(std::shared_ptr<IFileSystem> fs, std::string notes_dir,
              IFileInvalidationTarget &target, WatcherConfig config = {});

  void prime();
  [[nodiscard]] std::vector<WatchChange> poll();

  void run(const std::atomic<bool> &keep_running, const ChangeCallback &on_change);

  [[nodiscard]] std::size_t tracked_files() const { return file_mtimes_.size(); }

private:
  [[nodiscard]] std::map<std::string, std::int64_t> snapshot() const;

  std::shared_ptr<IFileSystem> fs_;
  std::string notes_dir_;
  IFileInvalidationTarget &target_;
  WatcherConfig config_;
  std::map<std::string, std::int64_t> file_mtimes_;
  bool primed_ = false;
};

} // namespace notegraph::graph
