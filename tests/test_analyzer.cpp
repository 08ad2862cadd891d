#include "test_framework.hpp"

#include "notegraph/graph/analyzer.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

namespace {

using notegraph::graph::AnalyzeOptions;
using notegraph::graph::GraphCache;
using notegraph::graph::NoteGraphAnalyzer;
using notegraph::testing::InMemoryFileSystem;

constexpr const char *NOTES = "/notes";

struct AnalyzerFixture {
  std::shared_ptr<InMemoryFileSystem> fs = std::make_shared<InMemoryFileSystem>();
  std::shared_ptr<GraphCache> cache = std::make_shared<GraphCache>(fs);
  NoteGraphAnalyzer analyzer{fs, cache};
};

bool from_cache(const notegraph::testing::RecordingObserver &recorder) {
  const auto events = recorder.events();
  for (auto it = events.rbegin(); it != events.rend(); ++it) {
    if (const auto *analyzed = std::get_if<notegraph::observability::GraphAnalyzedEvent>(&*it)) {
      return analyzed->from_cache;
    }
  }
  return false;
}

} // namespace

void register_analyzer_tests(std::vector<notegraph::tests::TestCase> &tests) {
  using notegraph::tests::require;
  namespace graph = notegraph::graph;
  namespace obs = notegraph::observability;

  tests.push_back({"analyzer_resolves_non_ascii_case_variants", [] {
                     AnalyzerFixture f;
                     f.fs->set_file("/notes/élan.md", "");
                     f.fs->set_file("/notes/a.md", "see [[Élan]]");
                     f.fs->set_file("/notes/b.md", "[[КЛЮЧ]]");
                     f.fs->set_file("/notes/ключ.md", "");

                     const auto stats = f.analyzer.analyze(NOTES);
                     require(stats.dangling_links.empty(), "case variants resolve to existing notes");
                     require(stats.unique_connections == 2, "both links connect");
                     require(f.analyzer.backlinks_for_note(NOTES, "élan").size() == 1,
                             "élan has a backlink from a");
                   }});

  tests.push_back({"analyzer_backlinks_and_orphans", [] {
                     AnalyzerFixture f;
                     f.fs->set_file("/notes/A.md", "Links to [[B]]");
                     f.fs->set_file("/notes/B.md", "Back to [[A]]");
                     f.fs->set_file("/notes/C.md", "No links at all");

                     const auto stats = f.analyzer.analyze(NOTES);
                     require(stats.note_count == 3, "three notes");
                     require(stats.unique_connections == 2, "A->B and B->A");
                     require(stats.total_mentions == 2, "two mentions");
                     require(stats.orphan_notes == std::vector<std::string>({"/notes/C.md"}),
                             "only C is an orphan");
                     require(stats.dangling_links.empty(), "no dangling links");

                     require(stats.forward_links.size() == 3, "every note has a forward entry");
                     require(stats.forward_links.at("/notes/A.md") == std::vector<std::string>({"B"}),
                             "A links to B");
                     require(stats.forward_links.at("/notes/C.md").empty(), "C links nowhere");

                     const auto &to_a = stats.backlinks.at("A");
                     require(to_a.size() == 1 && to_a[0].note_path == "/notes/B.md",
                             "A is referenced by B");
                     require(to_a[0].note_title == "B" && to_a[0].note_id == "B", "source metadata");
                     require(!to_a[0].context.has_value(), "no context unless requested");

                     require(stats.notes.size() == 3 && stats.notes[0].basename == "A",
                             "note metadata in path order");
                   }});

  tests.push_back({"analyzer_dangling_links_aggregate_sources", [] {
                     AnalyzerFixture f;
                     f.fs->set_file("/notes/A.md", "[[Missing Note]] and again [[Missing Note]]");
                     f.fs->set_file("/notes/B.md", "[[Missing Note]] [[Other Gap]]");

                     const auto dangling = f.analyzer.find_dangling_links(NOTES);
                     require(dangling.size() == 2, "two dangling targets");
                     require(dangling[0].target == "Missing Note", "first seen target first");
                     require(dangling[0].sources.size() == 2, "two source notes");
                     require(dangling[0].sources[0].note_path == "/notes/A.md" &&
                                 dangling[0].sources[0].count == 2,
                             "A mentions it twice");
                     require(dangling[0].sources[1].count == 1, "B mentions it once");
                     require(dangling[0].total_occurrences() == 3, "three occurrences");
                     require(dangling[1].target == "Other Gap", "second target");
                   }});

  tests.push_back({"analyzer_orphans_consider_dangling_links_outgoing", [] {
                     AnalyzerFixture f;
                     f.fs->set_file("/notes/A.md", "[[Nowhere]]");
                     f.fs->set_file("/notes/B.md", "plain");
                     const auto orphans = f.analyzer.find_orphan_notes(NOTES);
                     require(orphans == std::vector<std::string>({"/notes/B.md"}),
                             "a note with only dangling links is not an orphan");
                   }});

  tests.push_back({"analyzer_frontmatter_title_and_id_resolve_links", [] {
                     AnalyzerFixture f;
                     f.fs->set_file("/notes/alpha.md", "---\ntitle: Alpha Note\nid: a-1\n---\nbody");
                     f.fs->set_file("/notes/B.md", "[[Alpha Note]]");
                     f.fs->set_file("/notes/C.md", "[[alpha]]");
                     f.fs->set_file("/notes/D.md", "[[a-1]]");

                     const auto stats = f.analyzer.analyze(NOTES);
                     require(stats.dangling_links.empty(), "title, basename and id all resolve");
                     require(stats.backlinks.at("Alpha Note").size() == 3,
                             "backlinks keyed by display title");
                     require(stats.forward_links.at("/notes/C.md") ==
                                 std::vector<std::string>({"Alpha Note"}),
                             "forward links hold display titles");
                     require(stats.orphan_notes.empty(), "no orphans");
                     require(stats.notes[0].id == "a-1" && stats.notes[0].title == "Alpha Note",
                             "metadata from front matter");
                   }});

  tests.push_back({"analyzer_normalized_link_matching", [] {
                     AnalyzerFixture f;
                     f.fs->set_file("/notes/My Note.md", "");
                     f.fs->set_file("/notes/A.md", "[[my-note]] and [[MY_NOTE.md]]");
                     const auto stats = f.analyzer.analyze(NOTES);
                     require(stats.dangling_links.empty(), "normalized variants resolve");
                     require(stats.backlinks.at("My Note").size() == 1, "one backlink per source");
                   }});

  tests.push_back({"analyzer_one_backlink_per_source_note", [] {
                     AnalyzerFixture f;
                     f.fs->set_file("/notes/A.md", "[[B]] and [[B|bee]]");
                     f.fs->set_file("/notes/B.md", "");
                     const auto stats = f.analyzer.analyze(NOTES);
                     const auto &entries = stats.backlinks.at("B");
                     require(entries.size() == 1, "duplicate links collapse to one entry");
                     require(!entries[0].alias.has_value(), "first occurrence wins");
                     require(stats.total_mentions == 2, "both mentions counted");
                     require(stats.unique_connections == 1, "one connection");
                   }});

  tests.push_back({"analyzer_alias_and_context", [] {
                     AnalyzerFixture f;
                     f.fs->set_file("/notes/A.md", "Intro text [[B|the b note]] outro");
                     f.fs->set_file("/notes/B.md", "");
                     AnalyzeOptions options;
                     options.include_context = true;
                     const auto stats = f.analyzer.analyze(NOTES, options);
                     const auto &entry = stats.backlinks.at("B").front();
                     require(entry.alias == std::optional<std::string>("the b note"), "alias kept");
                     require(entry.context == std::optional<std::string>(
                                                  "Intro text [[B|the b note]] outro"),
                             "context around the link");
                   }});

  tests.push_back({"analyzer_skips_hidden_dirs_and_walks_nested", [] {
                     AnalyzerFixture f;
                     f.fs->set_file("/notes/A.md", "");
                     f.fs->set_file("/notes/sub/deeper/D.md", "[[A]]");
                     f.fs->set_file("/notes/.obsidian/cache.md", "[[Ghost]]");
                     f.fs->set_file("/notes/readme.txt", "[[Ghost]]");
                     const auto stats = f.analyzer.analyze(NOTES);
                     require(stats.note_count == 2, "hidden and non-markdown files ignored");
                     require(stats.dangling_links.empty(), "hidden note links ignored");
                     require(stats.backlinks.at("A").front().note_path == "/notes/sub/deeper/D.md",
                             "nested note found");
                   }});

  tests.push_back({"analyzer_missing_directory_is_empty", [] {
                     AnalyzerFixture f;
                     const auto stats = f.analyzer.analyze("/does/not/exist");
                     require(stats == graph::NoteGraphStats{}, "missing dir yields empty stats");
                   }});

  tests.push_back({"analyzer_unreadable_entries_are_skipped", [] {
                     const notegraph::testing::ScopedRecordingObserver recorder;
                     AnalyzerFixture f;
                     f.fs->set_file("/notes/A.md", "[[U]]");
                     f.fs->set_file("/notes/U.md", "[[A]]");
                     f.fs->set_file("/notes/locked/L.md", "[[A]]");
                     f.fs->set_unreadable("/notes/locked");
                     f.fs->set_unreadable("/notes/U.md");

                     const auto stats = f.analyzer.analyze(NOTES);
                     require(stats.note_count == 2, "unlistable directory skipped");
                     require(stats.backlinks.at("U").size() == 1, "unreadable note is still a target");
                     require(!stats.backlinks.contains("A"), "unreadable note contributes no links");
                     require(recorder->count<obs::WarningEvent>() == 1, "one read warning");
                   }});

  tests.push_back({"analyzer_cache_hit_reads_nothing", [] {
                     const notegraph::testing::ScopedRecordingObserver recorder;
                     AnalyzerFixture f;
                     f.fs->set_file("/notes/A.md", "[[B]]");
                     f.fs->set_file("/notes/B.md", "[[A]]");

                     const auto first = f.analyzer.analyze(NOTES);
                     require(!from_cache(*recorder), "first run computes");
                     f.fs->reset_read_counts();
                     f.cache->reset_counters();

                     const auto second = f.analyzer.analyze(NOTES);
                     require(from_cache(*recorder), "second run served from cache");
                     require(first == second, "cached stats identical");
                     require(f.fs->read_count() == 0, "no note content read on a hit");
                     require(f.cache->fingerprinter().hash_computations() == 0, "no hashing on a hit");
                   }});

  tests.push_back({"analyzer_touch_keeps_cache", [] {
                     const notegraph::testing::ScopedRecordingObserver recorder;
                     AnalyzerFixture f;
                     f.fs->set_file("/notes/A.md", "[[B]]");
                     f.fs->set_file("/notes/B.md", "");
                     (void)f.analyzer.analyze(NOTES);
                     f.fs->touch("/notes/A.md");
                     (void)f.analyzer.analyze(NOTES);
                     require(from_cache(*recorder), "same bytes keep the cached result");
                   }});

  tests.push_back({"analyzer_detects_modified_added_and_removed_notes", [] {
                     AnalyzerFixture f;
                     f.fs->set_file("/notes/A.md", "");
                     f.fs->set_file("/notes/B.md", "");
                     require(f.analyzer.analyze(NOTES).unique_connections == 0, "no links yet");

                     f.fs->set_file("/notes/A.md", "[[B]]");
                     require(f.analyzer.analyze(NOTES).unique_connections == 1,
                             "modified note should be re-read");

                     f.fs->set_file("/notes/C.md", "[[A]]");
                     require(f.analyzer.analyze(NOTES).note_count == 3, "new note picked up");

                     f.fs->remove_file("/notes/B.md");
                     const auto stats = f.analyzer.analyze(NOTES);
                     require(stats.note_count == 2, "removed note dropped");
                     require(stats.dangling_links.size() == 1 && stats.dangling_links[0].target == "B",
                             "link to removed note becomes dangling");
                   }});

  tests.push_back({"analyzer_cache_keys_and_invalidate", [] {
                     AnalyzerFixture f;
                     f.fs->set_file("/notes/A.md", "[[B]]");
                     f.fs->set_file("/notes/B.md", "");
                     require(NoteGraphAnalyzer::cache_key(NOTES, AnalyzeOptions{}) == "graph-stats:/notes",
                             "plain key");
                     AnalyzeOptions with_context;
                     with_context.include_context = true;
                     require(NoteGraphAnalyzer::cache_key(NOTES, with_context) ==
                                 "graph-stats:/notes+context:50",
                             "context key");

                     (void)f.analyzer.analyze(NOTES);
                     (void)f.analyzer.backlinks_for_note(NOTES, "B");
                     require(f.cache->stats().cache_size == 2, "two cached variants");

                     const auto removed = f.analyzer.invalidate(NOTES);
                     require(removed.size() == 2, "both variants invalidated");
                     require(f.cache->stats().cache_size == 0, "cache emptied");
                   }});

  tests.push_back({"analyzer_use_cache_false_bypasses_cache", [] {
                     AnalyzerFixture f;
                     f.fs->set_file("/notes/A.md", "");
                     AnalyzeOptions options;
                     options.use_cache = false;
                     (void)f.analyzer.analyze(NOTES, options);
                     require(f.cache->stats().cache_size == 0, "nothing stored");
                   }});

  tests.push_back({"analyzer_queries_by_note", [] {
                     AnalyzerFixture f;
                     f.fs->set_file("/notes/Project Plan.md", "");
                     f.fs->set_file("/notes/A.md", "see [[Project Plan]] and [[Missing]]");

                     const auto backlinks = f.analyzer.backlinks_for_note(NOTES, "project-plan");
                     require(backlinks.size() == 1 && backlinks[0].note_path == "/notes/A.md",
                             "lookup falls back to normalized titles");
                     require(backlinks[0].context.has_value(), "note queries include context");
                     require(f.analyzer.backlinks_for_note(NOTES, "Nobody").empty(), "unknown title");

                     require(f.analyzer.forward_links_for_note(NOTES, "/notes/A.md") ==
                                 std::vector<std::string>({"Project Plan"}),
                             "forward links exclude dangling targets");
                     require(f.analyzer.forward_links_for_note(NOTES, "/notes/zzz.md").empty(),
                             "unknown path");

                     const auto quick = f.analyzer.quick_stats(NOTES);
                     require(quick == graph::QuickNoteStats{.note_count = 2,
                                                            .connection_count = 1,
                                                            .dangling_count = 1,
                                                            .orphan_count = 0},
                             "quick stats projection");
                   }});

  tests.push_back({"analyzer_io_concurrency_does_not_change_result", [] {
                     auto fs = std::make_shared<InMemoryFileSystem>();
                     for (int i = 0; i < 40; ++i) {
                       fs->set_file("/notes/n" + std::to_string(i) + ".md",
                                    "[[n" + std::to_string((i + 1) % 40) + "]] [[gap" +
                                        std::to_string(i % 3) + "]]");
                     }
                     NoteGraphAnalyzer serial(fs, nullptr, 1);
                     NoteGraphAnalyzer parallel(fs, nullptr, 8);
                     const auto a = serial.analyze(NOTES);
                     const auto b = parallel.analyze(NOTES);
                     require(a == b, "worker count must not affect output");
                     require(a.note_count == 40 && a.unique_connections == 40, "ring of notes");
                     require(a.dangling_links.size() == 3, "three gap targets");
                   }});

  tests.push_back({"analyzer_local_file_system", [] {
                     const notegraph::testing::TempWorkspace workspace;
                     workspace.create_file("A.md", "[[B]]");
                     workspace.create_file("B.md", "[[A]]");
                     const auto orphan = workspace.create_file("C.md", "lonely");
                     workspace.create_file(".hidden/D.md", "[[C]]");

                     auto fs = graph::make_local_file_system();
                     NoteGraphAnalyzer analyzer(fs, std::make_shared<GraphCache>(fs));
                     const auto stats = analyzer.analyze(workspace.dir());
                     require(stats.note_count == 3, "three visible notes");
                     require(stats.orphan_notes == std::vector<std::string>({orphan}),
                             "C is the orphan");
                     const auto again = analyzer.analyze(workspace.dir());
                     require(stats == again, "cached result matches");
                   }});
}
