#include "notegraph/graph/file_system.hpp"

#include "notegraph/common/fs.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>

namespace notegraph::graph {

namespace fs = std::filesystem;

bool LocalFileSystem::is_directory(const std::string &path) const {
  std::error_code ec;
  return fs::is_directory(path, ec);
}

common::Result<std::vector<DirEntry>> LocalFileSystem::list_directory(const std::string &path) const {
  std::error_code ec;
  fs::directory_iterator it(path, ec);
  if (ec) {
    return common::Result<std::vector<DirEntry>>::failure("Failed to list " + path + ": " +
                                                          ec.message());
  }

  std::vector<DirEntry> entries;
  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      return common::Result<std::vector<DirEntry>>::failure("Failed to list " + path + ": " +
                                                            ec.message());
    }
    std::error_code type_ec;
    entries.push_back(DirEntry{
        .name = it->path().filename().string(),
        .is_directory = it->is_directory(type_ec),
        .is_regular_file = it->is_regular_file(type_ec),
    });
  }
  return common::Result<std::vector<DirEntry>>::success(std::move(entries));
}

common::Result<std::string> LocalFileSystem::read_file(const std::string &path) const {
  return common::read_text_file(path);
}

common::Status LocalFileSystem::write_file(const std::string &path, const std::string &content) {
  return common::write_text_file(path, content);
}

common::Result<std::int64_t> LocalFileSystem::modified_time(const std::string &path) const {
  std::error_code ec;
  const auto stamp = fs::last_write_time(path, ec);
  if (ec) {
    return common::Result<std::int64_t>::failure("Failed to stat " + path + ": " + ec.message());
  }
  const auto nanos =
      std::chrono::duration_cast<std::chrono::nanoseconds>(stamp.time_since_epoch()).count();
  return common::Result<std::int64_t>::success(static_cast<std::int64_t>(nanos));
}

std::shared_ptr<IFileSystem> make_local_file_system() { return std::make_shared<LocalFileSystem>(); }

std::string join_path(const std::string &dir, const std::string &name) {
  return (fs::path(dir) / name).string();
}

std::string note_basename(const std::string &path) {
  std::string name = fs::path(path).filename().string();
  if (common::ends_with(name, ".md")) {
    name.resize(name.size() - 3);
  }
  return name;
}

std::vector<std::string> collect_markdown_files(const IFileSystem &fs, const std::string &root) {
  std::vector<std::string> files;
  if (!fs.is_directory(root)) {
    return files;
  }

  std::vector<std::string> pending{root};
  while (!pending.empty()) {
    const std::string dir = std::move(pending.back());
    pending.pop_back();

    auto listing = fs.list_directory(dir);
    if (!listing.ok()) {
      continue;
    }
    for (const auto &entry : listing.value()) {
      if (entry.is_directory) {
        if (!common::starts_with(entry.name, ".")) {
          pending.push_back(join_path(dir, entry.name));
        }
        continue;
      }
      if (entry.is_regular_file && common::ends_with(entry.name, ".md")) {
        files.push_back(join_path(dir, entry.name));
      }
    }
  }

  std::sort(files.begin(), files.end());
  return files;
}

} // namespace notegraph::graph
