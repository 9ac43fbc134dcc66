#include <gitscope/report.hpp>

#include <fmt/format.h>

namespace gitscope {

std::string json_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (char ch : s) {
    auto c = static_cast<unsigned char>(ch);
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20)
        out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
      else
        out.push_back(ch);
    }
  }
  return out;
}

static std::string json_str(const std::optional<std::string> &s) {
  return s ? fmt::format("\"{}\"", json_escape(*s)) : "null";
}

static char status_code(FileStatus s) {
  switch (s) {
  case FileStatus::Modified:
    return 'M';
  case FileStatus::Added:
    return 'A';
  case FileStatus::Deleted:
    return 'D';
  case FileStatus::Renamed:
    return 'R';
  case FileStatus::Untracked:
    return '?';
  case FileStatus::Conflicted:
    return 'U';
  }
  return 'M';
}

static void text_list(std::string &out, const char *title,
                      const std::vector<AggregatedFileStatus> &files) {
  out += fmt::format("{} ({}):\n", title, files.size());
  for (const auto &f : files) {
    std::string path = f.old_path ? fmt::format("{} -> {}", *f.old_path, f.full_path)
                                  : f.full_path;
    out += fmt::format("  {} {} +{} -{}\n", status_code(f.status), path,
                       f.lines_added, f.lines_removed);
  }
}

std::string render_text(const AggregationResult &r) {
  std::string out;
  if (r.branch)
    out += fmt::format("branch: {}\n", *r.branch);
  for (const auto &repo : r.repos)
    out += fmt::format("repo: {} ({})\n", repo.name,
                       repo.branch.value_or("no branch"));
  text_list(out, "staged", r.staged_files);
  text_list(out, "unstaged", r.unstaged_files);
  return out;
}

static std::string json_file(const AggregatedFileStatus &f) {
  return fmt::format(
      R"({{"fileName":"{}","filePath":"{}","fullPath":"{}","repo":{},"status":"{}","isStaged":{},"linesAdded":{},"linesRemoved":{},"oldPath":{}}})",
      json_escape(f.file_name), json_escape(f.dir_path),
      json_escape(f.full_path), json_str(f.repo), to_string(f.status),
      f.staged ? "true" : "false", f.lines_added, f.lines_removed,
      json_str(f.old_path));
}

static std::string json_files(const std::vector<AggregatedFileStatus> &files) {
  std::string out = "[";
  for (size_t i = 0; i < files.size(); ++i) {
    if (i)
      out += ',';
    out += json_file(files[i]);
  }
  out += ']';
  return out;
}

std::string render_json(const AggregationResult &r,
                        const std::vector<std::string> &warnings) {
  std::string repos = "[";
  for (size_t i = 0; i < r.repos.size(); ++i) {
    if (i)
      repos += ',';
    repos += fmt::format(R"({{"name":"{}","branch":{}}})",
                         json_escape(r.repos[i].name),
                         json_str(r.repos[i].branch));
  }
  repos += ']';

  std::string warns = "[";
  for (size_t i = 0; i < warnings.size(); ++i) {
    if (i)
      warns += ',';
    warns += fmt::format("\"{}\"", json_escape(warnings[i]));
  }
  warns += ']';

  return fmt::format(
      R"({{"stagedFiles":{},"unstagedFiles":{},"branch":{},"repos":{},"totalStaged":{},"totalUnstaged":{},"warnings":{}}})",
      json_files(r.staged_files), json_files(r.unstaged_files),
      json_str(r.branch), repos, r.total_staged, r.total_unstaged, warns);
}

std::string render_repos(const std::vector<DiscoveredRepo> &repos) {
  std::string out;
  for (const auto &r : repos)
    out += fmt::format("{}\t{}\n", r.relative_path, r.absolute_path.string());
  return out;
}

} // namespace gitscope
