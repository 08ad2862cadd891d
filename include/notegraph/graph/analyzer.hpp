#pragma once

#include "notegraph/graph/file_system.hpp"
#include "notegraph/graph/incremental_cache.hpp"
#include "notegraph/graph/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace notegraph::graph {

using GraphCache = IncrementalCache<NoteGraphStats>;

inline constexpr std::size_t DEFAULT_IO_CONCURRENCY = 8;

class NoteGraphAnalyzer {
public:
  NoteGraphAnalyzer(std::shared_ptr<IFileSystem> fs, std::shared_ptr<GraphCache> cache,
                    std::size_t io_concurrency = DEFAULT_IO_CONCURRENCY);

  [[nodiscard]] NoteGraphStats analyze(const std::string &notes_dir,
                                       const AnalyzeOptions &options = {});

  [[nodiscard]] std::vector<BacklinkEntry> backlinks_for_note(const std::string &notes_dir,
                                                              const std::string &title);
  [[nodiscard]] std::vector<std::string> forward_links_for_note(const std::string &notes_dir,
                                                                const std::string &note_path);
  [[nodiscard]] std::vector<DanglingLink> find_dangling_links(const std::string &notes_dir);
  [[nodiscard]] std::vector<std::string> find_orphan_notes(const std::string &notes_dir);
  [[nodiscard]] QuickNoteStats quick_stats(const std::string &notes_dir);

  std::vector<std::string> invalidate(const std::string &notes_dir);

  [[nodiscard]] static std::string cache_key(const std::string &notes_dir,
                                             const AnalyzeOptions &options);

  [[nodiscard]] GraphCache &cache() { return *cache_; }
  [[nodiscard]] IFileSystem &file_system() { return *fs_; }

private:
  struct LoadedNote {
    NoteMetadata metadata;
    std::optional<std::string> content;
  };

  [[nodiscard]] std::vector<LoadedNote> load_notes(const std::vector<std::string> &files) const;

  std::shared_ptr<IFileSystem> fs_;
  std::shared_ptr<GraphCache> cache_;
  std::size_t io_concurrency_;
};

[[nodiscard]] QuickNoteStats project_quick_stats(const NoteGraphStats &stats);

} // namespace notegraph::graph
