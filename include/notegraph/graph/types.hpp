#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace notegraph::graph {

struct WikilinkPosition {
  /// Code point offsets into the scanned content; `end` is one past the closing `]]`.
  std::size_t start = 0;
  std::size_t end = 0;
  std::size_t line = 0;

  bool operator==(const WikilinkPosition &) const = default;
};

struct Wikilink {
  std::string raw;
  std::string target;
  std::optional<std::string> section;
  std::optional<std::string> alias;
  WikilinkPosition position;

  bool operator==(const Wikilink &) const = default;
};

struct NoteMetadata {
  std::string id;
  std::string title;
  std::string path;
  std::string basename;

  bool operator==(const NoteMetadata &) const = default;
};

struct BacklinkEntry {
  std::string note_id;
  std::string note_path;
  std::string note_title;
  std::optional<std::string> context;
  std::optional<std::string> alias;

  bool operator==(const BacklinkEntry &) const = default;
};

struct DanglingSource {
  std::string note_id;
  std::string note_path;
  std::string note_title;
  std::size_t count = 0;

  bool operator==(const DanglingSource &) const = default;
};

struct DanglingLink {
  std::string target;
  std::vector<DanglingSource> sources;

  [[nodiscard]] std::size_t total_occurrences() const;

  bool operator==(const DanglingLink &) const = default;
};

struct NoteGraphStats {
  std::size_t note_count = 0;
  std::size_t unique_connections = 0;
  std::size_t total_mentions = 0;
  std::map<std::string, std::vector<std::string>> forward_links;
  std::map<std::string, std::vector<BacklinkEntry>> backlinks;
  std::vector<DanglingLink> dangling_links;
  std::vector<std::string> orphan_notes;
  std::vector<NoteMetadata> notes;

  bool operator==(const NoteGraphStats &) const = default;
};

struct QuickNoteStats {
  std::size_t note_count = 0;
  std::size_t connection_count = 0;
  std::size_t dangling_count = 0;
  std::size_t orphan_count = 0;

  bool operator==(const QuickNoteStats &) const = default;
};

struct AnalyzeOptions {
  bool include_context = false;
  std::size_t context_length = 50;
  bool use_cache = true;
};

} // namespace notegraph::graph
