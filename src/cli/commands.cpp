#include "notegraph/cli/commands.hpp"

#include "notegraph/common/fs.hpp"
#include "notegraph/config/config.hpp"
#include "notegraph/graph/analyzer.hpp"
#include "notegraph/graph/cluster.hpp"
#include "notegraph/graph/graph_json.hpp"
#include "notegraph/graph/link_merger.hpp"
#include "notegraph/graph/pagerank.hpp"
#include "notegraph/graph/watcher.hpp"
#include "notegraph/observability/factory.hpp"
#include "notegraph/observability/global.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace notegraph::cli {

namespace {

std::atomic<bool> g_watching{false};

void stop_watching(int) { g_watching = false; }

std::string version_string() {
#ifdef NOTEGRAPH_VERSION
  std::string version = NOTEGRAPH_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef NOTEGRAPH_GIT_COMMIT
  const std::string commit = NOTEGRAPH_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "notegraph " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::optional<double> parse_double(const std::string &raw) {
  try {
    std::size_t used = 0;
    const double value = std::stod(raw, &used);
    if (used != raw.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<std::size_t> parse_count(const std::string &raw) {
  if (raw.empty() || raw.front() == '-') {
    return std::nullopt;
  }
  try {
    std::size_t used = 0;
    const auto value = std::stoull(raw, &used);
    if (used != raw.size()) {
      return std::nullopt;
    }
    return static_cast<std::size_t>(value);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

/// Config, notes directory and engine objects shared by every graph command.
struct Session {
  config::Config config;
  std::string notes_dir;
  bool json = false;
  std::shared_ptr<graph::IFileSystem> fs;
  std::shared_ptr<graph::GraphCache> cache;
  std::unique_ptr<graph::NoteGraphAnalyzer> analyzer;

  [[nodiscard]] graph::AnalyzeOptions analyze_options() const {
    graph::AnalyzeOptions options;
    options.include_context = config.graph.include_context;
    options.context_length = config.graph.context_length;
    options.use_cache = config.graph.use_cache;
    return options;
  }
};

common::Result<Session> open_session(std::vector<std::string> &args) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg.forward_error<Session>();
  }

  Session session;
  session.config = std::move(cfg.value());
  std::string dir_override;
  if (take_option(args, "--dir", "-d", dir_override)) {
    session.config.notes_dir = dir_override;
  }
  session.json = take_flag(args, "--json");

  auto validation = config::validate_config(session.config);
  if (!validation.ok()) {
    return validation.forward_error<Session>();
  }

  observability::set_global_observer(observability::create_observer(session.config));
  for (const auto &warning : validation.value()) {
    observability::record_warning("config", warning);
  }

  session.notes_dir = common::expand_path(session.config.notes_dir);
  session.fs = graph::make_local_file_system();
  session.cache = std::make_shared<graph::GraphCache>(
      session.fs, graph::IncrementalCacheOptions{
                      .ttl = std::chrono::seconds(session.config.cache.ttl_seconds), .clock = {}});
  session.analyzer = std::make_unique<graph::NoteGraphAnalyzer>(session.fs, session.cache,
                                                                session.config.graph.io_concurrency);
  return common::Result<Session>::success(std::move(session));
}

void print_list(const std::vector<std::string> &values) {
  for (const auto &value : values) {
    std::cout << value << "\n";
  }
}

int run_stats(Session &session) {
  const auto stats = session.analyzer->analyze(session.notes_dir, session.analyze_options());
  if (session.json) {
    std::cout << graph::to_json(stats) << "\n";
    return 0;
  }
  std::cout << "Notes: " << stats.note_count << "\n";
  std::cout << "Connections: " << stats.unique_connections << "\n";
  std::cout << "Mentions: " << stats.total_mentions << "\n";
  std::cout << "Linked notes: " << stats.backlinks.size() << "\n";
  std::cout << "Dangling links: " << stats.dangling_links.size() << "\n";
  std::cout << "Orphan notes: " << stats.orphan_notes.size() << "\n";
  return 0;
}

int run_quick(Session &session) {
  const auto quick = session.analyzer->quick_stats(session.notes_dir);
  if (session.json) {
    std::cout << graph::to_json(quick) << "\n";
    return 0;
  }
  std::cout << quick.note_count << " notes, " << quick.connection_count << " connections, "
            << quick.dangling_count << " dangling, " << quick.orphan_count << " orphans\n";
  return 0;
}

int run_backlinks(Session &session, const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "usage: notegraph backlinks <title>\n";
    return 1;
  }
  const auto entries = session.analyzer->backlinks_for_note(session.notes_dir, args[0]);
  if (session.json) {
    std::cout << graph::to_json(entries) << "\n";
    return 0;
  }
  for (const auto &entry : entries) {
    std::cout << entry.note_title << " (" << entry.note_path << ")\n";
    if (entry.context.has_value()) {
      std::cout << "  " << *entry.context << "\n";
    }
  }
  return 0;
}

int run_forward(Session &session, const std::vector<std::string> &args) {
  if (args.empty()) {
    std::cerr << "usage: notegraph forward <note-path>\n";
    return 1;
  }
  std::string path = common::expand_path(args[0]);
  if (!std::filesystem::path(path).is_absolute()) {
    path = graph::join_path(session.notes_dir, path);
  }
  const auto titles = session.analyzer->forward_links_for_note(session.notes_dir, path);
  if (session.json) {
    std::cout << graph::to_json(titles) << "\n";
  } else {
    print_list(titles);
  }
  return 0;
}

int run_dangling(Session &session) {
  const auto links = session.analyzer->find_dangling_links(session.notes_dir);
  if (session.json) {
    std::cout << graph::to_json(links) << "\n";
    return 0;
  }
  for (const auto &link : links) {
    std::cout << link.target << " x" << link.total_occurrences() << " in " << link.sources.size()
              << " note(s)\n";
  }
  return 0;
}

int run_orphans(Session &session) {
  const auto orphans = session.analyzer->find_orphan_notes(session.notes_dir);
  if (session.json) {
    std::cout << graph::to_json(orphans) << "\n";
  } else {
    print_list(orphans);
  }
  return 0;
}

int run_clusters(Session &session, std::vector<std::string> args) {
  graph::ClusterOptions options{.threshold = session.config.cluster.threshold,
                                .min_cluster_size = session.config.cluster.min_cluster_size,
                                .max_results = session.config.cluster.max_results,
                                .max_input = session.config.cluster.max_input,
                                .allow_large_input = session.config.cluster.allow_large_input};
  std::string raw;
  if (take_option(args, "--threshold", "-t", raw)) {
    const auto threshold = parse_double(raw);
    if (!threshold.has_value() || *threshold < 0.0 || *threshold > 1.0) {
      std::cerr << "invalid threshold: " << raw << "\n";
      return 1;
    }
    options.threshold = *threshold;
  }
  if (take_option(args, "--min-size", "", raw)) {
    const auto size = parse_count(raw);
    if (!size.has_value() || *size == 0) {
      std::cerr << "invalid cluster size: " << raw << "\n";
      return 1;
    }
    options.min_cluster_size = *size;
  }
  if (take_option(args, "--max", "", raw)) {
    const auto max = parse_count(raw);
    if (!max.has_value()) {
      std::cerr << "invalid result limit: " << raw << "\n";
      return 1;
    }
    options.max_results = *max;
  }
  if (take_flag(args, "--all")) {
    options.allow_large_input = true;
  }

  const auto links = session.analyzer->find_dangling_links(session.notes_dir);
  const auto report = graph::cluster_dangling_links_report(links, options);
  if (session.json) {
    std::cout << graph::to_json(report.clusters) << "\n";
    return 0;
  }
  if (report.truncated) {
    std::cout << "(clustered the " << report.considered << " most referenced of " << links.size()
              << " dangling links; pass --all to include every one)\n";
  }
  for (const auto &cluster : report.clusters) {
    std::cout << cluster.representative_target << " [" << cluster.total_occurrences
              << " occurrences, avg similarity " << cluster.average_similarity << "]\n";
    for (const auto &member : cluster.members) {
      if (member.target == cluster.representative_target) {
        continue;
      }
      std::cout << "  " << member.target << " (" << member.similarity << ")\n";
    }
  }
  return 0;
}

int run_similar(Session &session, std::vector<std::string> args) {
  double threshold = session.config.cluster.threshold;
  std::string raw;
  if (take_option(args, "--threshold", "-t", raw)) {
    const auto parsed = parse_double(raw);
    if (!parsed.has_value()) {
      std::cerr << "invalid threshold: " << raw << "\n";
      return 1;
    }
    threshold = *parsed;
  }
  if (args.empty()) {
    std::cerr << "usage: notegraph similar <target> [--threshold T]\n";
    return 1;
  }
  const auto links = session.analyzer->find_dangling_links(session.notes_dir);
  const auto matches = graph::find_similar_dangling_links(args[0], links, threshold);
  if (session.json) {
    std::cout << graph::to_json(matches) << "\n";
    return 0;
  }
  for (const auto &match : matches) {
    std::cout << match.dangling_link.target << " (" << match.similarity.score << ")\n";
  }
  return 0;
}

int run_pagerank(Session &session, std::vector<std::string> args) {
  std::size_t top = 20;
  std::string raw;
  if (take_option(args, "--top", "-n", raw)) {
    const auto parsed = parse_count(raw);
    if (!parsed.has_value()) {
      std::cerr << "invalid --top: " << raw << "\n";
      return 1;
    }
    top = *parsed;
  }

  const auto stats = session.analyzer->analyze(session.notes_dir, session.analyze_options());
  const graph::PageRankOptions options{.damping = session.config.pagerank.damping,
                                       .iterations = session.config.pagerank.iterations,
                                       .tolerance = session.config.pagerank.tolerance};
  const auto result = graph::calculate_page_rank(stats, options);
  if (session.json) {
    std::cout << graph::to_json(result) << "\n";
    return 0;
  }

  std::vector<std::pair<std::string, double>> ranked(result.scores.begin(), result.scores.end());
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const auto &a, const auto &b) { return a.second > b.second; });
  if (ranked.size() > top) {
    ranked.resize(top);
  }
  for (const auto &[path, score] : ranked) {
    std::cout << score << "  " << path << "\n";
  }
  std::cout << "(" << result.iterations << " iterations, "
            << (result.converged ? "converged" : "not converged") << ")\n";
  return 0;
}

int run_merge(Session &session, std::vector<std::string> args) {
  graph::MergeLinkRequest request;
  request.preserve_as_alias = take_flag(args, "--alias");
  const bool dry_run = take_flag(args, "--dry-run");
  if (args.size() < 2) {
    std::cerr << "usage: notegraph merge <new-target> <old-target>... [--alias] [--dry-run]\n";
    return 1;
  }
  request.new_target = args[0];
  request.old_targets.assign(args.begin() + 1, args.end());

  graph::LinkMerger merger(*session.analyzer);
  if (dry_run) {
    auto preview = merger.preview(session.notes_dir, request);
    if (!preview.ok()) {
      std::cerr << preview.error() << "\n";
      return 1;
    }
    if (session.json) {
      std::cout << graph::to_json(preview.value()) << "\n";
      return 0;
    }
    for (const auto &file : preview.value()) {
      std::cout << file.file_path << "\n";
      for (const auto &match : file.matches) {
        std::cout << "  " << match.line << ": " << match.original << " -> " << match.replaced
                  << "\n";
      }
    }
    return 0;
  }

  auto result = merger.merge(session.notes_dir, request);
  if (!result.ok()) {
    std::cerr << result.error() << "\n";
    return 1;
  }
  if (session.json) {
    std::cout << graph::to_json(result.value()) << "\n";
  } else {
    std::cout << "Replaced " << result.value().links_replaced << " link(s) in "
              << result.value().files_modified << " file(s)\n";
    for (const auto &[path, message] : result.value().errors) {
      std::cerr << path << ": " << message << "\n";
    }
  }
  return result.value().errors.empty() ? 0 : 1;
}

int run_watch(Session &session) {
  const graph::WatcherConfig watch_config{
      .poll_interval = std::chrono::milliseconds(session.config.watch.interval_ms)};
  graph::NoteWatcher watcher(session.fs, session.notes_dir, *session.cache, watch_config);

  const auto initial = session.analyzer->quick_stats(session.notes_dir);
  std::cout << "Watching " << session.notes_dir << " (" << initial.note_count
            << " notes). Press Ctrl-C to stop.\n";

  g_watching = true;
  std::signal(SIGINT, stop_watching);
  std::signal(SIGTERM, stop_watching);
  watcher.run(g_watching, [&session](const std::vector<graph::WatchChange> &changes) {
    for (const auto &change : changes) {
      std::cout << graph::change_kind_name(change.kind) << ": " << change.path << "\n";
    }
    const auto quick = session.analyzer->quick_stats(session.notes_dir);
    if (session.json) {
      std::cout << graph::to_json(quick) << "\n";
    } else {
      std::cout << quick.note_count << " notes, " << quick.connection_count << " connections, "
                << quick.dangling_count << " dangling, " << quick.orphan_count << " orphans\n";
    }
    std::cout.flush();
  });
  return 0;
}

} // namespace

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << "  notegraph" << RESET << DIM << " - wikilink graph for a folder of notes"
            << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET
            << "notegraph [--config PATH] <command> [--dir DIR] [--json] [options]\n\n";

  std::cout << BOLD << "  GRAPH" << RESET << "\n";
  std::cout << "  " << GREEN << "stats" << RESET << DIM << "             Full link statistics" << RESET << "\n";
  std::cout << "  " << GREEN << "quick" << RESET << DIM << "             Note, connection, dangling and orphan counts" << RESET << "\n";
  std::cout << "  " << GREEN << "backlinks" << RESET << " TITLE" << DIM << "   Notes linking to TITLE" << RESET << "\n";
  std::cout << "  " << GREEN << "forward" << RESET << " PATH" << DIM << "      Notes linked from PATH" << RESET << "\n";
  std::cout << "  " << GREEN << "orphans" << RESET << DIM << "           Notes without any links" << RESET << "\n";
  std::cout << "  " << GREEN << "pagerank" << RESET << DIM << "          Rank notes by link importance (--top N)" << RESET << "\n\n";

  std::cout << BOLD << "  LINK REPAIR" << RESET << "\n";
  std::cout << "  " << GREEN << "dangling" << RESET << DIM << "          Links to notes that do not exist" << RESET << "\n";
  std::cout << "  " << GREEN << "clusters" << RESET << DIM << "          Group near-duplicate dangling links (--threshold T)" << RESET << "\n";
  std::cout << "  " << GREEN << "similar" << RESET << " TARGET" << DIM << "    Dangling links resembling TARGET" << RESET << "\n";
  std::cout << "  " << GREEN << "merge" << RESET << " NEW OLD..." << DIM << " Rewrite links (--alias, --dry-run)" << RESET << "\n\n";

  std::cout << BOLD << "  OTHER" << RESET << "\n";
  std::cout << "  " << GREEN << "watch" << RESET << DIM << "             Refresh stats as notes change" << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM << "       Show the config file location" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "           Show version" << RESET << "\n";
  std::cout << "\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  static const std::vector<std::string> graph_commands = {
      "stats", "quick",    "backlinks", "forward", "dangling", "orphans",
      "clusters", "similar", "pagerank",  "merge",   "watch"};
  if (std::find(graph_commands.begin(), graph_commands.end(), subcommand) == graph_commands.end()) {
    std::cerr << "Unknown command: " << subcommand << "\n";
    print_help();
    return 1;
  }

  auto session = open_session(args);
  if (!session.ok()) {
    std::cerr << session.error() << "\n";
    return 1;
  }
  auto &s = session.value();

  int code = 0;
  if (subcommand == "stats") {
    code = run_stats(s);
  } else if (subcommand == "quick") {
    code = run_quick(s);
  } else if (subcommand == "backlinks") {
    code = run_backlinks(s, args);
  } else if (subcommand == "forward") {
    code = run_forward(s, args);
  } else if (subcommand == "dangling") {
    code = run_dangling(s);
  } else if (subcommand == "orphans") {
    code = run_orphans(s);
  } else if (subcommand == "clusters") {
    code = run_clusters(s, std::move(args));
  } else if (subcommand == "similar") {
    code = run_similar(s, std::move(args));
  } else if (subcommand == "pagerank") {
    code = run_pagerank(s, std::move(args));
  } else if (subcommand == "merge") {
    code = run_merge(s, std::move(args));
  } else {
    code = run_watch(s);
  }

  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return code;
}

} // namespace notegraph::cli
