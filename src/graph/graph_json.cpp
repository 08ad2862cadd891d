#include "notegraph/graph/graph_json.hpp"

#include "notegraph/common/json_util.hpp"

#include <sstream>

namespace notegraph::graph {

namespace {

using common::json_number;
using common::json_quote;

template <typename T, typename Fn>
void write_array(std::ostringstream &json, const std::vector<T> &items, Fn &&write_item) {
  json << "[";
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      json << ",";
    }
    write_item(json, items[i]);
  }
  json << "]";
}

void write_string(std::ostringstream &json, const std::string &value) { json << json_quote(value); }

void write_backlink(std::ostringstream &json, const BacklinkEntry &entry) {
  json << "{\"noteId\":" << json_quote(entry.note_id)
       << ",\"notePath\":" << json_quote(entry.note_path)
       << ",\"noteTitle\":" << json_quote(entry.note_title);
  if (entry.context.has_value()) {
    json << ",\"context\":" << json_quote(*entry.context);
  }
  if (entry.alias.has_value()) {
    json << ",\"alias\":" << json_quote(*entry.alias);
  }
  json << "}";
}

void write_source(std::ostringstream &json, const DanglingSource &source) {
  json << "{\"noteId\":" << json_quote(source.note_id)
       << ",\"notePath\":" << json_quote(source.note_path)
       << ",\"noteTitle\":" << json_quote(source.note_title) << ",\"count\":" << source.count << "}";
}

void write_dangling(std::ostringstream &json, const DanglingLink &link) {
  json << "{\"target\":" << json_quote(link.target) << ",\"sources\":";
  write_array(json, link.sources, write_source);
  json << "}";
}

void write_similarity(std::ostringstream &json, const SimilarityScore &score) {
  json << "{\"score\":" << json_number(score.score)
       << ",\"jaroWinkler\":" << json_number(score.jaro_winkler)
       << ",\"ngram\":" << json_number(score.ngram)
       << ",\"tokenOverlap\":" << json_number(score.token_overlap)
       << ",\"containment\":" << json_number(score.containment) << "}";
}

void write_member(std::ostringstream &json, const SimilarLinkMember &member) {
  json << "{\"target\":" << json_quote(member.target)
       << ",\"similarity\":" << json_number(member.similarity) << ",\"sources\":";
  write_array(json, member.sources, write_source);
  json << "}";
}

void write_cluster(std::ostringstream &json, const SimilarLinkCluster &cluster) {
  json << "{\"id\":" << json_quote(cluster.id)
       << ",\"representativeTarget\":" << json_quote(cluster.representative_target)
       << ",\"members\":";
  write_array(json, cluster.members, write_member);
  json << ",\"totalOccurrences\":" << cluster.total_occurrences
       << ",\"averageSimilarity\":" << json_number(cluster.average_similarity) << "}";
}

void write_scores(std::ostringstream &json, const std::map<std::string, double> &scores) {
  json << "{";
  bool first = true;
  for (const auto &[key, score] : scores) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << json_quote(key) << ":" << json_number(score);
  }
  json << "}";
}

} // namespace

std::string to_json(const NoteGraphStats &stats) {
  std::ostringstream json;
  json << "{\"noteCount\":" << stats.note_count
       << ",\"uniqueConnections\":" << stats.unique_connections
       << ",\"totalMentions\":" << stats.total_mentions << ",\"forwardLinks\":{";
  bool first = true;
  for (const auto &[path, titles] : stats.forward_links) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << json_quote(path) << ":";
    write_array(json, titles, write_string);
  }
  json << "},\"backlinks\":{";
  first = true;
  for (const auto &[title, entries] : stats.backlinks) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << json_quote(title) << ":";
    write_array(json, entries, write_backlink);
  }
  json << "},\"danglingLinks\":";
  write_array(json, stats.dangling_links, write_dangling);
  json << ",\"orphanNotes\":";
  write_array(json, stats.orphan_notes, write_string);
  json << ",\"noteMetadata\":";
  write_array(json, stats.notes, [](std::ostringstream &out, const NoteMetadata &note) {
    out << "{\"id\":" << json_quote(note.id) << ",\"title\":" << json_quote(note.title)
        << ",\"path\":" << json_quote(note.path) << ",\"basename\":" << json_quote(note.basename)
        << "}";
  });
  json << "}";
  return json.str();
}

std::string to_json(const QuickNoteStats &stats) {
  std::ostringstream json;
  json << "{\"noteCount\":" << stats.note_count << ",\"connectionCount\":" << stats.connection_count
       << ",\"danglingCount\":" << stats.dangling_count << ",\"orphanCount\":" << stats.orphan_count
       << "}";
  return json.str();
}

std::string to_json(const std::vector<BacklinkEntry> &entries) {
  std::ostringstream json;
  write_array(json, entries, write_backlink);
  return json.str();
}

std::string to_json(const std::vector<DanglingLink> &links) {
  std::ostringstream json;
  write_array(json, links, write_dangling);
  return json.str();
}

std::string to_json(const std::vector<SimilarLinkCluster> &clusters) {
  std::ostringstream json;
  write_array(json, clusters, write_cluster);
  return json.str();
}

std::string to_json(const std::vector<SimilarDanglingLink> &matches) {
  std::ostringstream json;
  write_array(json, matches, [](std::ostringstream &out, const SimilarDanglingLink &match) {
    out << "{\"danglingLink\":";
    write_dangling(out, match.dangling_link);
    out << ",\"similarity\":";
    write_similarity(out, match.similarity);
    out << "}";
  });
  return json.str();
}

std::string to_json(const PageRankResult &result) {
  std::ostringstream json;
  json << "{\"scores\":";
  write_scores(json, result.scores);
  json << ",\"titleScores\":";
  write_scores(json, result.title_scores);
  json << ",\"iterations\":" << result.iterations
       << ",\"converged\":" << (result.converged ? "true" : "false") << "}";
  return json.str();
}

std::string to_json(const MergeLinkResult &result) {
  std::ostringstream json;
  json << "{\"filesModified\":" << result.files_modified
       << ",\"linksReplaced\":" << result.links_replaced << ",\"modifiedFiles\":";
  write_array(json, result.modified_files, write_string);
  json << ",\"errors\":{";
  bool first = true;
  for (const auto &[path, message] : result.errors) {
    if (!first) {
      json << ",";
    }
    first = false;
    json << json_quote(path) << ":" << json_quote(message);
  }
  json << "}}";
  return json.str();
}

std::string to_json(const std::vector<MergePreviewFile> &preview) {
  std::ostringstream json;
  write_array(json, preview, [](std::ostringstream &out, const MergePreviewFile &file) {
    out << "{\"filePath\":" << json_quote(file.file_path) << ",\"matches\":";
    write_array(out, file.matches, [](std::ostringstream &inner, const MergePreviewMatch &match) {
      inner << "{\"original\":" << json_quote(match.original)
            << ",\"replaced\":" << json_quote(match.replaced) << ",\"line\":" << match.line << "}";
    });
    out << "}";
  });
  return json.str();
}

std::string to_json(const std::vector<std::string> &values) {
  std::ostringstream json;
  write_array(json, values, write_string);
  return json.str();
}

} // namespace notegraph::graph
