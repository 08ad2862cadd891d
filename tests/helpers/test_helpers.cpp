#include "tests/helpers/test_helpers.hpp"

#include "notegraph/observability/global.hpp"

#include <fstream>
#include <memory>
#include <random>

namespace notegraph::testing {

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("notegraph-test-notes-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::string TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
  return file_path.string();
}

namespace {

bool is_under(const std::string &path, const std::string &dir) {
  const std::string prefix = dir.ends_with('/') ? dir : dir + "/";
  return path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

void InMemoryFileSystem::set_file(const std::string &path, const std::string &content) {
  std::lock_guard<std::mutex> lock(mutex_);
  files_[path] = File{.content = content, .mtime = ++clock_};
}

void InMemoryFileSystem::touch(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto it = files_.find(path); it != files_.end()) {
    it->second.mtime = ++clock_;
  }
}

void InMemoryFileSystem::remove_file(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  files_.erase(path);
}

void InMemoryFileSystem::add_directory(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  directories_.insert(path);
}

void InMemoryFileSystem::set_unreadable(const std::string &path, const bool unreadable) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unreadable) {
    unreadable_.insert(path);
  } else {
    unreadable_.erase(path);
  }
}

void InMemoryFileSystem::set_unwritable(const std::string &path, const bool unwritable) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unwritable) {
    unwritable_.insert(path);
  } else {
    unwritable_.erase(path);
  }
}

std::string InMemoryFileSystem::content(const std::string &path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = files_.find(path);
  return it == files_.end() ? std::string() : it->second.content;
}

std::size_t InMemoryFileSystem::read_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t total = 0;
  for (const auto &[path, count] : reads_) {
    total += count;
  }
  return total;
}

std::size_t InMemoryFileSystem::read_count(const std::string &path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = reads_.find(path);
  return it == reads_.end() ? 0 : it->second;
}

void InMemoryFileSystem::reset_read_counts() {
  std::lock_guard<std::mutex> lock(mutex_);
  reads_.clear();
}

bool InMemoryFileSystem::is_directory(const std::string &path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (directories_.contains(path)) {
    return true;
  }
  for (const auto &[file, data] : files_) {
    if (is_under(file, path)) {
      return true;
    }
  }
  for (const auto &dir : directories_) {
    if (is_under(dir, path)) {
      return true;
    }
  }
  return false;
}

common::Result<std::vector<graph::DirEntry>>
InMemoryFileSystem::list_directory(const std::string &path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unreadable_.contains(path)) {
    return common::Result<std::vector<graph::DirEntry>>::failure("permission denied: " + path);
  }

  const std::string prefix = path.ends_with('/') ? path : path + "/";
  std::map<std::string, bool> children;
  auto add_child = [&](const std::string &full, const bool leaf_is_file) {
    if (!is_under(full, path)) {
      return;
    }
    const std::string rest = full.substr(prefix.size());
    const auto slash = rest.find('/');
    if (slash == std::string::npos) {
      children.try_emplace(rest, !leaf_is_file);
    } else {
      children[rest.substr(0, slash)] = true;
    }
  };
  for (const auto &[file, data] : files_) {
    add_child(file, true);
  }
  for (const auto &dir : directories_) {
    add_child(dir, false);
  }

  std::vector<graph::DirEntry> entries;
  for (const auto &[name, is_dir] : children) {
    entries.push_back(
        graph::DirEntry{.name = name, .is_directory = is_dir, .is_regular_file = !is_dir});
  }
  return common::Result<std::vector<graph::DirEntry>>::success(std::move(entries));
}

common::Result<std::string> InMemoryFileSystem::read_file(const std::string &path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  ++reads_[path];
  if (unreadable_.contains(path)) {
    return common::Result<std::string>::failure("permission denied: " + path);
  }
  const auto it = files_.find(path);
  if (it == files_.end()) {
    return common::Result<std::string>::failure("no such file: " + path);
  }
  return common::Result<std::string>::success(it->second.content);
}

common::Status InMemoryFileSystem::write_file(const std::string &path, const std::string &content) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unwritable_.contains(path)) {
    return common::Status::error("read-only file: " + path);
  }
  files_[path] = File{.content = content, .mtime = ++clock_};
  return common::Status::success();
}

common::Result<std::int64_t> InMemoryFileSystem::modified_time(const std::string &path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = files_.find(path);
  if (it == files_.end()) {
    return common::Result<std::int64_t>::failure("no such file: " + path);
  }
  return common::Result<std::int64_t>::success(it->second.mtime);
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> RecordingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> RecordingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

ScopedRecordingObserver::ScopedRecordingObserver() {
  auto observer = std::make_unique<RecordingObserver>();
  observer_ = observer.get();
  observability::set_global_observer(std::move(observer));
}

ScopedRecordingObserver::~ScopedRecordingObserver() { observability::set_global_observer(nullptr); }

} // namespace notegraph::testing
