#pragma once

#include "notegraph/common/result.hpp"

#include <filesystem>
#include <string>

namespace notegraph::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] std::string trim_start(const std::string &input);
[[nodiscard]] std::string trim_end(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);
[[nodiscard]] Status write_text_file(const std::filesystem::path &path, const std::string &content);

} // namespace notegraph::common
