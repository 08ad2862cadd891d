#include "notegraph/graph/watcher.hpp"

#include <algorithm>
#include <thread>

namespace notegraph::graph {

const char *change_kind_name(const ChangeKind kind) {
  switch (kind) {
  case ChangeKind::Added:
    return "added";
  case ChangeKind::Modified:
    return "modified";
  case ChangeKind::Removed:
    return "removed";
  }
  return "modified";
}

NoteWatcher::NoteWatcher(std::shared_ptr<IFileSystem> fs, std::string notes_dir,
                         IFileInvalidationTarget &target, WatcherConfig config)
    : fs_(std::move(fs)), notes_dir_(std::move(notes_dir)), target_(target), config_(config) {}

std::map<std::string, std::int64_t> NoteWatcher::snapshot() const {
  std::map<std::string, std::int64_t> mtimes;
  for (const auto &path : collect_markdown_files(*fs_, notes_dir_)) {
    const auto mtime = fs_->modified_time(path);
    if (mtime.ok()) {
      mtimes.emplace(path, mtime.value());
    }
  }
  return mtimes;
}

void NoteWatcher::prime() {
  file_mtimes_ = snapshot();
  primed_ = true;
}

std::vector<WatchChange> NoteWatcher::poll() {
  if (!primed_) {
    prime();
    return {};
  }

  auto current = snapshot();
  std::vector<WatchChange> changes;
  for (const auto &[path, mtime] : current) {
    const auto it = file_mtimes_.find(path);
    if (it == file_mtimes_.end()) {
      changes.push_back(WatchChange{.path = path, .kind = ChangeKind::Added, .invalidated = {}});
    } else if (it->second != mtime) {
      changes.push_back(WatchChange{.path = path, .kind = ChangeKind::Modified, .invalidated = {}});
    }
  }
  for (const auto &[path, mtime] : file_mtimes_) {
    if (!current.contains(path)) {
      changes.push_back(WatchChange{.path = path, .kind = ChangeKind::Removed, .invalidated = {}});
    }
  }

  for (auto &change : changes) {
    change.invalidated = target_.invalidate_by_file(change.path);
  }
  file_mtimes_ = std::move(current);
  return changes;
}

void NoteWatcher::run(const std::atomic<bool> &keep_running, const ChangeCallback &on_change) {
  prime();
  while (keep_running) {
    const auto wait_steps = std::max<long long>(1, config_.poll_interval.count() / 100);
    for (long long i = 0; i < wait_steps && keep_running; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (!keep_running) {
      break;
    }
    auto changes = poll();
    if (!changes.empty() && on_change) {
      on_change(changes);
    }
  }
}

} // namespace notegraph::graph
