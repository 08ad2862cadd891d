#pragma once

#include "notegraph/graph/cluster.hpp"
#include "notegraph/graph/link_merger.hpp"
#include "notegraph/graph/pagerank.hpp"
#include "notegraph/graph/types.hpp"

#include <string>
#include <vector>

namespace notegraph::graph {

[[nodiscard]] std::string to_json(const NoteGraphStats &stats);
[[nodiscard]] std::string to_json(const QuickNoteStats &stats);
[[nodiscard]] std::string to_json(const std::vector<BacklinkEntry> &entries);
[[nodiscard]] std::string to_json(const std::vector<DanglingLink> &links);
[[nodiscard]] std::string to_json(const std::vector<SimilarLinkCluster> &clusters);
[[nodiscard]] std::string to_json(const std::vector<SimilarDanglingLink> &matches);
[[nodiscard]] std::string to_json(const PageRankResult &result);
[[nodiscard]] std::string to_json(const MergeLinkResult &result);
[[nodiscard]] std::string to_json(const std::vector<MergePreviewFile> &preview);
[[nodiscard]] std::string to_json(const std::vector<std::string> &values);

} // namespace notegraph::graph
