#include "notegraph/graph/fingerprint.hpp"

#include "notegraph/common/hash.hpp"

namespace notegraph::graph {

FileFingerprinter::FileFingerprinter(std::shared_ptr<IFileSystem> fs) : fs_(std::move(fs)) {}

std::optional<std::string> FileFingerprinter::hash_at(const std::string &path,
                                                      const std::int64_t mtime) {
  if (const auto it = memo_.find(path); it != memo_.end() && it->second.mtime == mtime) {
    return it->second.hash;
  }

  auto content = fs_->read_file(path);
  if (!content.ok()) {
    memo_.erase(path);
    return std::nullopt;
  }
  ++hash_computations_;
  std::string hash = common::short_content_hash(content.value());
  memo_[path] = Memo{.hash = hash, .mtime = mtime};
  return hash;
}

FileDependency FileFingerprinter::fingerprint(const std::string &path) {
  FileDependency dependency{.path = path, .hash = "", .mtime = UNREADABLE_MTIME};

  ++stat_calls_;
  const auto mtime = fs_->modified_time(path);
  if (!mtime.ok()) {
    return dependency;
  }
  auto hash = hash_at(path, mtime.value());
  if (!hash.has_value()) {
    return dependency;
  }
  dependency.hash = std::move(*hash);
  dependency.mtime = mtime.value();
  return dependency;
}

DependencyCheck FileFingerprinter::check(const FileDependency &dependency) {
  if (dependency.mtime == UNREADABLE_MTIME) {
    return DependencyCheck{};
  }

  ++stat_calls_;
  const auto mtime = fs_->modified_time(dependency.path);
  if (!mtime.ok()) {
    memo_.erase(dependency.path);
    return DependencyCheck{};
  }
  if (mtime.value() == dependency.mtime) {
    return DependencyCheck{.state = DependencyState::Unchanged, .current_mtime = mtime.value()};
  }

  const auto hash = hash_at(dependency.path, mtime.value());
  if (!hash.has_value() || *hash != dependency.hash) {
    return DependencyCheck{.state = DependencyState::Changed, .current_mtime = mtime.value()};
  }
  return DependencyCheck{.state = DependencyState::Touched, .current_mtime = mtime.value()};
}

void FileFingerprinter::forget(const std::string &path) { memo_.erase(path); }

void FileFingerprinter::clear() { memo_.clear(); }

void FileFingerprinter::reset_counters() {
  hash_computations_ = 0;
  stat_calls_ = 0;
}

} // namespace notegraph::graph
