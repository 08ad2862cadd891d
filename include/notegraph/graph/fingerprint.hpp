#pragma once

#include "notegraph/graph/file_system.hpp"

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace notegraph::graph {

/// Stamp recorded for a dependency that could not be read; never matches a real file.
inline constexpr std::int64_t UNREADABLE_MTIME = std::numeric_limits<std::int64_t>::min();

struct FileDependency {
  std::string path;
  std::string hash;
  std::int64_t mtime = UNREADABLE_MTIME;

  bool operator==(const FileDependency &) const = default;
};

enum class DependencyState {
  Unchanged,
  Touched,
  Changed,
};

struct DependencyCheck {
  DependencyState state = DependencyState::Changed;
  std::int64_t current_mtime = UNREADABLE_MTIME;
};

class FileFingerprinter {
public:
  explicit FileFingerprinter(std::shared_ptr<IFileSystem> fs);

  [[nodiscard]] FileDependency fingerprint(const std::string &path);

  [[nodiscard]] DependencyCheck check(const FileDependency &dependency);

  void forget(const std::string &path);
  void clear();

  [[nodiscard]] std::size_t memo_size() const { return memo_.size(); }
  [[nodiscard]] std::uint64_t hash_computations() const { return hash_computations_; }
  [[nodiscard]] std::uint64_t stat_calls() const { return stat_calls_; }
  void reset_counters();

private:
  struct Memo {
    std::string hash;
    std::int64_t mtime = UNREADABLE_MTIME;
  };

  [[nodiscard]] std::optional<std::string> hash_at(const std::string &path, std::int64_t mtime);

  std::shared_ptr<IFileSystem> fs_;
  std::unordered_map<std::string, Memo> memo_;
  std::uint64_t hash_computations_ = 0;
  std::uint64_t stat_calls_ = 0;
};

} // namespace notegraph::graph
