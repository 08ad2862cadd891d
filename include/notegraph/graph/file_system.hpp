#pragma once

#include "notegraph/common/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace notegraph::graph {

struct DirEntry {
  std::string name;
  bool is_directory = false;
  bool is_regular_file = false;
};

/// Implementations must tolerate concurrent `read_file` calls.
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  [[nodiscard]] virtual bool is_directory(const std::string &path) const = 0;
  [[nodiscard]] virtual common::Result<std::vector<DirEntry>>
  list_directory(const std::string &path) const = 0;
  [[nodiscard]] virtual common::Result<std::string> read_file(const std::string &path) const = 0;
  [[nodiscard]] virtual common::Status write_file(const std::string &path,
                                                  const std::string &content) = 0;
  /// Modification stamp in nanoseconds; only compared for equality.
  [[nodiscard]] virtual common::Result<std::int64_t>
  modified_time(const std::string &path) const = 0;
};

class LocalFileSystem final : public IFileSystem {
public:
  [[nodiscard]] bool is_directory(const std::string &path) const override;
  [[nodiscard]] common::Result<std::vector<DirEntry>>
  list_directory(const std::string &path) const override;
  [[nodiscard]] common::Result<std::string> read_file(const std::string &path) const override;
  [[nodiscard]] common::Status write_file(const std::string &path,
                                          const std::string &content) override;
  [[nodiscard]] common::Result<std::int64_t> modified_time(const std::string &path) const override;
};

[[nodiscard]] std::shared_ptr<IFileSystem> make_local_file_system();

[[nodiscard]] std::string join_path(const std::string &dir, const std::string &name);

[[nodiscard]] std::string note_basename(const std::string &path);

[[nodiscard]] std::vector<std::string> collect_markdown_files(const IFileSystem &fs,
                                                              const std::string &root);

} // namespace notegraph::graph
