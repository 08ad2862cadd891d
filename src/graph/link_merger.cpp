#include "notegraph/graph/link_merger.hpp"

#include "notegraph/observability/global.hpp"

namespace notegraph::graph {

namespace {

std::string escape_regex(const std::string &text) {
  static const std::string special = R"(.*+?^${}()|[]\)";
  std::string out;
  out.reserve(text.size() * 2);
  for (const char ch : text) {
    if (special.find(ch) != std::string::npos) {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  return out;
}

std::string replacement_for(const std::smatch &match, const MergeLinkRequest &request) {
  const std::string original_target = match.str(1);
  std::string out = "[[" + request.new_target;
  if (match[2].matched && match.length(2) > 0) {
    out += "#" + match.str(2);
  }
  if (match[3].matched && match.length(3) > 0) {
    out += "|" + match.str(3);
  } else if (request.preserve_as_alias && original_target != request.new_target) {
    out += "|" + original_target;
  }
  out += "]]";
  return out;
}

} // namespace

common::Result<std::regex> build_replacement_regex(const std::vector<std::string> &targets) {
  if (targets.empty()) {
    return common::Result<std::regex>::failure("At least one target is required");
  }

  std::string alternatives;
  for (const auto &target : targets) {
    if (!alternatives.empty()) {
      alternatives.push_back('|');
    }
    alternatives += escape_regex(target);
  }
  const std::string pattern =
      R"(\[\[()" + alternatives + R"()(?:#([^\]|]+))?(?:\|([^\]]+))?\]\])";
  try {
    return common::Result<std::regex>::success(std::regex(pattern));
  } catch (const std::regex_error &e) {
    return common::Result<std::regex>::failure(std::string("Invalid link pattern: ") + e.what());
  }
}

common::Result<LinkReplacement> replace_links(const std::string &content,
                                              const MergeLinkRequest &request) {
  auto regex = build_replacement_regex(request.old_targets);
  if (!regex.ok()) {
    return regex.forward_error<LinkReplacement>();
  }

  LinkReplacement result;
  result.content.reserve(content.size());
  auto last = content.cbegin();
  for (std::sregex_iterator it(content.cbegin(), content.cend(), regex.value()), end; it != end;
       ++it) {
    const auto &match = *it;
    result.content.append(last, match[0].first);
    result.content += replacement_for(match, request);
    last = match[0].second;
    ++result.count;
  }
  result.content.append(last, content.cend());
  return common::Result<LinkReplacement>::success(std::move(result));
}

LinkMerger::LinkMerger(NoteGraphAnalyzer &analyzer) : analyzer_(analyzer) {}

common::Result<MergeLinkResult> LinkMerger::merge(const std::string &notes_dir,
                                                  const MergeLinkRequest &request) {
  MergeLinkResult result;
  if (request.new_target.empty()) {
    return common::Result<MergeLinkResult>::failure("new target must not be empty");
  }
  if (request.old_targets.empty()) {
    return common::Result<MergeLinkResult>::success(std::move(result));
  }

  analyzer_.invalidate(notes_dir);

  auto &fs = analyzer_.file_system();
  for (const auto &path : collect_markdown_files(fs, notes_dir)) {
    auto content = fs.read_file(path);
    if (!content.ok()) {
      result.errors[path] = "Failed to read file: " + content.error();
      continue;
    }
    auto replaced = replace_links(content.value(), request);
    if (!replaced.ok()) {
      return replaced.forward_error<MergeLinkResult>();
    }
    if (replaced.value().count == 0) {
      continue;
    }
    auto status = fs.write_file(path, replaced.value().content);
    if (!status.ok()) {
      result.errors[path] = "Failed to write file: " + status.error();
      continue;
    }
    ++result.files_modified;
    result.links_replaced += replaced.value().count;
    result.modified_files.push_back(path);
  }

  if (result.files_modified > 0) {
    analyzer_.invalidate(notes_dir);
  }
  for (const auto &[path, message] : result.errors) {
    observability::record_error("link_merger", path + ": " + message);
  }
  observability::record_links_merged(result.files_modified, result.links_replaced);
  return common::Result<MergeLinkResult>::success(std::move(result));
}

common::Result<std::vector<MergePreviewFile>>
LinkMerger::preview(const std::string &notes_dir, const MergeLinkRequest &request) {
  std::vector<MergePreviewFile> files;
  if (request.old_targets.empty()) {
    return common::Result<std::vector<MergePreviewFile>>::success(std::move(files));
  }
  auto regex = build_replacement_regex(request.old_targets);
  if (!regex.ok()) {
    return regex.forward_error<std::vector<MergePreviewFile>>();
  }

  auto &fs = analyzer_.file_system();
  for (const auto &path : collect_markdown_files(fs, notes_dir)) {
    auto content = fs.read_file(path);
    if (!content.ok()) {
      continue;
    }

    MergePreviewFile preview{.file_path = path, .matches = {}};
    const std::string &text = content.value();
    std::size_t line_start = 0;
    std::size_t line_number = 1;
    while (line_start <= text.size()) {
      std::size_t line_end = text.find('\n', line_start);
      if (line_end == std::string::npos) {
        line_end = text.size();
      }
      const std::string line = text.substr(line_start, line_end - line_start);
      for (std::sregex_iterator it(line.cbegin(), line.cend(), regex.value()), end; it != end;
           ++it) {
        preview.matches.push_back(MergePreviewMatch{
            .original = it->str(0), .replaced = replacement_for(*it, request), .line = line_number});
      }
      if (line_end == text.size()) {
        break;
      }
      line_start = line_end + 1;
      ++line_number;
    }

    if (!preview.matches.empty()) {
      files.push_back(std::move(preview));
    }
  }
  return common::Result<std::vector<MergePreviewFile>>::success(std::move(files));
}

} // namespace notegraph::graph
