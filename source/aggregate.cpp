#include <gitscope/aggregate.hpp>
#include <gitscope/numstat.hpp>
#include <gitscope/sections.hpp>

namespace gitscope {

std::string with_repo_prefix(const std::optional<std::string> &repo,
                             const std::string &path) {
  if (!repo || repo->empty())
    return path;
  return *repo + "/" + path;
}

static void split_name(const std::string &path, std::string &name,
                       std::string &dir) {
  auto slash = path.rfind('/');
  if (slash == std::string::npos) {
    name = path;
    dir.clear();
    return;
  }
  name = path.substr(slash + 1);
  if (name.empty())
    name = path;
  dir = path.substr(0, slash);
}

static bool is_staged_char(char c) { return c != ' ' && c != '.' && c != '?'; }
static bool is_unstaged_char(char c) { return c != ' ' && c != '.'; }

static DiffStat lookup(const DiffStatsMap &m, const std::string &path) {
  auto it = m.find(path);
  return it == m.end() ? DiffStat{} : it->second;
}

AggregationResult build_status_files(std::string_view status_output,
                                     std::string_view unstaged_diff_output,
                                     std::string_view staged_diff_output) {
  AggregationResult r;
  const auto sections = split_sections(status_output);
  const auto unstaged_by_repo =
      section_bodies_by_repo(split_sections(unstaged_diff_output));
  const auto staged_by_repo =
      section_bodies_by_repo(split_sections(staged_diff_output));

  bool multi_repo = false;
  for (const auto &s : sections)
    if (s.repo)
      multi_repo = true;

  std::optional<std::string> legacy_branch;

  for (const auto &section : sections) {
    const auto summary = parse_status(section.body);
    auto branch = current_branch(summary);
    if (section.repo)
      r.repos.push_back({*section.repo, branch});
    else if (!multi_repo)
      legacy_branch = branch;

    const auto key = section.repo.value_or("");
    auto body_of = [&key](const auto &by_repo) -> std::string_view {
      auto it = by_repo.find(key);
      return it == by_repo.end() ? std::string_view{} : it->second;
    };
    const auto staged_stats = make_stats_map(parse_numstat(body_of(staged_by_repo)));
    const auto unstaged_stats =
        make_stats_map(parse_numstat(body_of(unstaged_by_repo)));

    for (const auto &rec : summary.files) {
      AggregatedFileStatus base;
      split_name(rec.path, base.file_name, base.dir_path);
      base.full_path = with_repo_prefix(section.repo, rec.path);
      base.repo = section.repo;
      if (rec.orig_path)
        base.old_path = with_repo_prefix(section.repo, *rec.orig_path);

      // одна запись может попасть в оба списка (частично проиндексирован)
      if (is_staged_char(rec.index)) {
        auto e = base;
        auto st = lookup(staged_stats, rec.path);
        e.status = file_status_from_char(rec.index);
        e.staged = true;
        e.lines_added = st.added;
        e.lines_removed = st.removed;
        r.staged_files.push_back(std::move(e));
      }
      if (is_unstaged_char(rec.worktree)) {
        auto e = base;
        auto st = lookup(unstaged_stats, rec.path);
        e.status = file_status_from_char(rec.worktree);
        e.staged = false;
        e.lines_added = st.added;
        e.lines_removed = st.removed;
        r.unstaged_files.push_back(std::move(e));
      }
    }

    for (const auto &path : summary.not_added) {
      if (!path.empty() && path.back() == '/')
        continue;
      AggregatedFileStatus e;
      split_name(path, e.file_name, e.dir_path);
      e.full_path = with_repo_prefix(section.repo, path);
      e.repo = section.repo;
      e.status = FileStatus::Untracked;
      e.staged = false;
      r.unstaged_files.push_back(std::move(e));
    }
  }

  r.branch = multi_repo ? std::nullopt : legacy_branch;
  r.total_staged = r.staged_files.size();
  r.total_unstaged = r.unstaged_files.size();
  return r;
}

} // namespace gitscope
