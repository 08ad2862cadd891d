#include "notegraph/config/config.hpp"

#include "notegraph/common/fs.hpp"
#include "notegraph/common/toml.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace notegraph::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".notegraph";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("NOTEGRAPH_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::optional<std::size_t> parse_size(const char *raw) {
  const std::string value = common::trim(raw);
  std::size_t parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *dir = std::getenv("NOTEGRAPH_NOTES_DIR"); dir != nullptr && *dir) {
    config.notes_dir = dir;
  }

  if (const char *io = std::getenv("NOTEGRAPH_IO_CONCURRENCY"); io != nullptr && *io) {
    if (const auto parsed = parse_size(io); parsed.has_value()) {
      config.graph.io_concurrency = *parsed;
    }
  }

  if (const char *backend = std::getenv("NOTEGRAPH_OBSERVABILITY"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }

  const auto &doc = parsed.value();
  Config config;

  config.notes_dir = doc.get_string("notes_dir", config.notes_dir);

  config.graph.include_context = doc.get_bool("graph.include_context", config.graph.include_context);
  config.graph.context_length = static_cast<std::size_t>(
      doc.get_u64("graph.context_length", config.graph.context_length));
  config.graph.use_cache = doc.get_bool("graph.use_cache", config.graph.use_cache);
  config.graph.io_concurrency = static_cast<std::size_t>(
      doc.get_u64("graph.io_concurrency", config.graph.io_concurrency));

  config.cache.ttl_seconds = doc.get_u64("cache.ttl_seconds", config.cache.ttl_seconds);

  config.cluster.threshold = doc.get_double("cluster.threshold", config.cluster.threshold);
  config.cluster.min_cluster_size = static_cast<std::size_t>(
      doc.get_u64("cluster.min_cluster_size", config.cluster.min_cluster_size));
  config.cluster.max_results =
      static_cast<std::size_t>(doc.get_u64("cluster.max_results", config.cluster.max_results));
  config.cluster.max_input =
      static_cast<std::size_t>(doc.get_u64("cluster.max_input", config.cluster.max_input));
  config.cluster.allow_large_input =
      doc.get_bool("cluster.allow_large_input", config.cluster.allow_large_input);

  config.pagerank.damping = doc.get_double("pagerank.damping", config.pagerank.damping);
  config.pagerank.iterations =
      static_cast<std::size_t>(doc.get_u64("pagerank.iterations", config.pagerank.iterations));
  config.pagerank.tolerance = doc.get_double("pagerank.tolerance", config.pagerank.tolerance);

  config.watch.interval_ms = doc.get_u64("watch.interval_ms", config.watch.interval_ms);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto text = common::read_text_file(path);
  if (!text.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto config = parse_config(text.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message());
    }
  }

  std::ostringstream file;
  file << "notes_dir = " << common::quote_toml_string(config.notes_dir) << "\n";

  file << "\n[graph]\n";
  file << "include_context = " << bool_to_toml(config.graph.include_context) << "\n";
  file << "context_length = " << config.graph.context_length << "\n";
  file << "use_cache = " << bool_to_toml(config.graph.use_cache) << "\n";
  file << "io_concurrency = " << config.graph.io_concurrency << "\n";

  file << "\n[cache]\n";
  file << "ttl_seconds = " << config.cache.ttl_seconds << "\n";

  file << "\n[cluster]\n";
  file << "threshold = " << config.cluster.threshold << "\n";
  file << "min_cluster_size = " << config.cluster.min_cluster_size << "\n";
  file << "max_results = " << config.cluster.max_results << "\n";
  file << "max_input = " << config.cluster.max_input << "\n";
  file << "allow_large_input = " << bool_to_toml(config.cluster.allow_large_input) << "\n";

  file << "\n[pagerank]\n";
  file << "damping = " << config.pagerank.damping << "\n";
  file << "iterations = " << config.pagerank.iterations << "\n";
  file << "tolerance = " << config.pagerank.tolerance << "\n";

  file << "\n[watch]\n";
  file << "interval_ms = " << config.watch.interval_ms << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  const std::filesystem::path tmp_path = path.string() + ".tmp";
  if (auto status = common::write_text_file(tmp_path, file.str()); !status.ok()) {
    return status;
  }

  std::error_code rename_ec;
  std::filesystem::rename(tmp_path, path, rename_ec);
  if (rename_ec) {
    return common::Status::error("Failed to replace config file: " + rename_ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (common::trim(config.notes_dir).empty()) {
    return common::Result<std::vector<std::string>>::failure("notes_dir must not be empty");
  }

  if (config.graph.io_concurrency == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "graph.io_concurrency must be at least 1");
  }

  if (config.cache.ttl_seconds == 0) {
    return common::Result<std::vector<std::string>>::failure("cache.ttl_seconds must be positive");
  }

  if (config.cluster.threshold < 0.0 || config.cluster.threshold > 1.0) {
    return common::Result<std::vector<std::string>>::failure(
        "cluster.threshold must be between 0.0 and 1.0");
  }

  if (config.cluster.min_cluster_size == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "cluster.min_cluster_size must be at least 1");
  }

  if (config.pagerank.damping <= 0.0 || config.pagerank.damping >= 1.0) {
    return common::Result<std::vector<std::string>>::failure(
        "pagerank.damping must be between 0.0 and 1.0 (exclusive)");
  }

  if (config.cluster.max_results == 0) {
    warnings.push_back("cluster.max_results is 0; clustering will return nothing");
  }

  if (config.pagerank.tolerance <= 0.0) {
    warnings.push_back("pagerank.tolerance <= 0 disables early convergence");
  }

  std::error_code ec;
  const std::filesystem::path notes_dir(common::expand_path(config.notes_dir));
  if (!std::filesystem::is_directory(notes_dir, ec)) {
    warnings.push_back("notes_dir does not exist: " + notes_dir.string());
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace notegraph::config
