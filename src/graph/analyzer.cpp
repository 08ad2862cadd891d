#include "notegraph/graph/analyzer.hpp"

#include "notegraph/common/fs.hpp"
#include "notegraph/graph/frontmatter.hpp"
#include "notegraph/graph/wikilinks.hpp"
#include "notegraph/observability/global.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <unordered_map>
#include <utility>

namespace notegraph::graph {

namespace {

constexpr const char *CACHE_TYPE = "graph-stats";

NoteMetadata metadata_for(const std::string &path, const std::optional<std::string> &content) {
  const std::string basename = note_basename(path);
  NoteMetadata metadata{.id = basename, .title = basename, .path = path, .basename = basename};
  if (!content.has_value()) {
    return metadata;
  }
  const auto front = parse_front_matter(*content);
  if (auto id = front.get("id"); id.has_value()) {
    metadata.id = std::move(*id);
  }
  if (auto title = front.get("title"); title.has_value()) {
    metadata.title = std::move(*title);
  }
  return metadata;
}

struct DanglingAccumulator {
  std::vector<DanglingLink> links;
  std::unordered_map<std::string, std::size_t> index_by_target;

  void add(const std::string &target, const NoteMetadata &source) {
    auto [it, inserted] = index_by_target.try_emplace(target, links.size());
    if (inserted) {
      links.push_back(DanglingLink{.target = target, .sources = {}});
    }
    auto &sources = links[it->second].sources;
    const auto existing = std::find_if(sources.begin(), sources.end(), [&source](const auto &s) {
      return s.note_path == source.path;
    });
    if (existing != sources.end()) {
      ++existing->count;
      return;
    }
    sources.push_back(DanglingSource{.note_id = source.id,
                                     .note_path = source.path,
                                     .note_title = source.title,
                                     .count = 1});
  }
};

} // namespace

NoteGraphAnalyzer::NoteGraphAnalyzer(std::shared_ptr<IFileSystem> fs,
                                     std::shared_ptr<GraphCache> cache,
                                     const std::size_t io_concurrency)
    : fs_(std::move(fs)), cache_(std::move(cache)),
      io_concurrency_(std::max<std::size_t>(1, io_concurrency)) {}

std::string NoteGraphAnalyzer::cache_key(const std::string &notes_dir,
                                         const AnalyzeOptions &options) {
  std::string key = std::string(CACHE_TYPE) + ":" + notes_dir;
  if (options.include_context) {
    key += "+context:" + std::to_string(options.context_length);
  }
  return key;
}

std::vector<NoteGraphAnalyzer::LoadedNote>
NoteGraphAnalyzer::load_notes(const std::vector<std::string> &files) const {
  std::vector<LoadedNote> notes(files.size());
  std::atomic<std::size_t> next{0};

  auto worker = [&]() {
    for (std::size_t i = next.fetch_add(1); i < files.size(); i = next.fetch_add(1)) {
      auto content = fs_->read_file(files[i]);
      if (content.ok()) {
        notes[i].content = std::move(content.value());
      }
      notes[i].metadata = metadata_for(files[i], notes[i].content);
    }
  };

  const std::size_t workers = std::min(io_concurrency_, files.size());
  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  for (std::size_t i = 1; i < workers; ++i) {
    futures.push_back(std::async(std::launch::async, worker));
  }
  worker();
  for (auto &future : futures) {
    future.get();
  }
  return notes;
}

NoteGraphStats NoteGraphAnalyzer::analyze(const std::string &notes_dir,
                                          const AnalyzeOptions &options) {
  const auto started = std::chrono::steady_clock::now();
  const std::string key = cache_key(notes_dir, options);

  if (options.use_cache && cache_) {
    // Catch notes created or deleted since the entry was stored.
    const CacheValidator same_file_set = [this, &notes_dir, &key]() {
      ValidationResult result;
      std::set<std::string> recorded;
      for (const auto &dependency : cache_->dependencies(key)) {
        recorded.insert(dependency.path);
      }
      for (const auto &path : collect_markdown_files(*fs_, notes_dir)) {
        if (recorded.erase(path) == 0) {
          result.changed_files.push_back(path);
        }
      }
      result.changed_files.insert(result.changed_files.end(), recorded.begin(), recorded.end());
      result.valid = result.changed_files.empty();
      return result;
    };

    if (auto cached = cache_->get(key, same_file_set); cached.has_value()) {
      const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);
      observability::record_graph_analyzed(notes_dir, cached->note_count, elapsed, true);
      return std::move(*cached);
    }
  }

  const auto files = collect_markdown_files(*fs_, notes_dir);
  const auto notes = load_notes(files);

  // Reachable by normalized title, basename and id; later notes win collisions.
  std::unordered_map<std::string, const NoteMetadata *> existing;
  for (const auto &note : notes) {
    const auto &metadata = note.metadata;
    existing[normalize_note_title(metadata.title)] = &metadata;
    existing[normalize_note_title(metadata.basename)] = &metadata;
    if (metadata.id != metadata.basename) {
      existing[normalize_note_title(metadata.id)] = &metadata;
    }
  }

  NoteGraphStats stats;
  stats.note_count = files.size();
  std::set<std::pair<std::string, std::string>> connections;
  std::set<std::string> has_outgoing;
  DanglingAccumulator dangling;

  for (const auto &note : notes) {
    const auto &source = note.metadata;
    stats.notes.push_back(source);
    auto &forward = stats.forward_links[source.path];
    if (!note.content.has_value()) {
      observability::record_warning("analyzer", "cannot read note " + source.path);
      continue;
    }

    const auto links = parse_wikilinks(*note.content);
    stats.total_mentions += links.size();
    if (!links.empty()) {
      has_outgoing.insert(source.path);
    }

    for (const auto &link : links) {
      const auto match = existing.find(normalize_note_title(link.target));
      if (match == existing.end()) {
        dangling.add(link.target, source);
        continue;
      }

      const NoteMetadata &target = *match->second;
      if (std::find(forward.begin(), forward.end(), target.title) == forward.end()) {
        forward.push_back(target.title);
      }
      connections.emplace(source.path, target.path);

      auto &entries = stats.backlinks[target.title];
      const bool seen = std::any_of(entries.begin(), entries.end(), [&source](const auto &entry) {
        return entry.note_path == source.path;
      });
      if (seen) {
        continue;
      }
      BacklinkEntry entry{.note_id = source.id,
                          .note_path = source.path,
                          .note_title = source.title,
                          .context = std::nullopt,
                          .alias = link.alias};
      if (options.include_context) {
        entry.context = extract_context(*note.content, link, options.context_length);
      }
      entries.push_back(std::move(entry));
    }
  }

  stats.unique_connections = connections.size();
  stats.dangling_links = std::move(dangling.links);
  for (const auto &note : notes) {
    const auto &metadata = note.metadata;
    if (!has_outgoing.contains(metadata.path) && !stats.backlinks.contains(metadata.title)) {
      stats.orphan_notes.push_back(metadata.path);
    }
  }

  if (options.use_cache && cache_) {
    cache_->set(key, stats, files);
    observability::record_metric(observability::HashComputationsMetric{
        .count = cache_->fingerprinter().hash_computations()});
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_graph_analyzed(notes_dir, stats.note_count, elapsed, false);
  observability::record_metric(observability::AnalysisLatencyMetric{.latency = elapsed});
  return stats;
}

std::vector<BacklinkEntry> NoteGraphAnalyzer::backlinks_for_note(const std::string &notes_dir,
                                                                 const std::string &title) {
  AnalyzeOptions options;
  options.include_context = true;
  const auto stats = analyze(notes_dir, options);

  if (const auto it = stats.backlinks.find(title); it != stats.backlinks.end()) {
    return it->second;
  }
  const std::string wanted = normalize_note_title(title);
  for (const auto &[key, entries] : stats.backlinks) {
    if (normalize_note_title(key) == wanted) {
      return entries;
    }
  }
  return {};
}

std::vector<std::string> NoteGraphAnalyzer::forward_links_for_note(const std::string &notes_dir,
                                                                   const std::string &note_path) {
  const auto stats = analyze(notes_dir);
  const auto it = stats.forward_links.find(note_path);
  return it == stats.forward_links.end() ? std::vector<std::string>{} : it->second;
}

std::vector<DanglingLink> NoteGraphAnalyzer::find_dangling_links(const std::string &notes_dir) {
  return analyze(notes_dir).dangling_links;
}

std::vector<std::string> NoteGraphAnalyzer::find_orphan_notes(const std::string &notes_dir) {
  return analyze(notes_dir).orphan_notes;
}

QuickNoteStats NoteGraphAnalyzer::quick_stats(const std::string &notes_dir) {
  return project_quick_stats(analyze(notes_dir));
}

std::vector<std::string> NoteGraphAnalyzer::invalidate(const std::string &notes_dir) {
  std::vector<std::string> removed;
  if (!cache_) {
    return removed;
  }
  const std::string base = cache_key(notes_dir, AnalyzeOptions{});
  for (const auto &key : cache_->stats().keys) {
    if (key == base || common::starts_with(key, base + "+context:")) {
      if (cache_->remove(key)) {
        removed.push_back(key);
      }
    }
  }
  return removed;
}

QuickNoteStats project_quick_stats(const NoteGraphStats &stats) {
  return QuickNoteStats{.note_count = stats.note_count,
                        .connection_count = stats.unique_connections,
                        .dangling_count = stats.dangling_links.size(),
                        .orphan_count = stats.orphan_notes.size()};
}

} // namespace notegraph::graph
