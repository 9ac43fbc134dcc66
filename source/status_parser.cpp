#include <gitscope/status_parser.hpp>

#include <cctype>
#include <charconv>

namespace gitscope {

const char *to_string(FileStatus s) {
  switch (s) {
  case FileStatus::Modified:
    return "modified";
  case FileStatus::Added:
    return "added";
  case FileStatus::Deleted:
    return "deleted";
  case FileStatus::Renamed:
    return "renamed";
  case FileStatus::Untracked:
    return "untracked";
  case FileStatus::Conflicted:
    return "conflicted";
  }
  return "modified";
}

FileStatus file_status_from_char(char c) {
  switch (c) {
  case 'M':
    return FileStatus::Modified;
  case 'A':
    return FileStatus::Added;
  case 'D':
    return FileStatus::Deleted;
  case 'R':
  case 'C':
    return FileStatus::Renamed;
  case '?':
    return FileStatus::Untracked;
  case 'U':
    return FileStatus::Conflicted;
  default:
    return FileStatus::Modified;
  }
}

static bool starts_with(std::string_view s, std::string_view p) {
  return s.substr(0, p.size()) == p;
}

// n полей через одиночный пробел, остаток строки (путь) в rest
static bool split_fields(std::string_view line, size_t n,
                         std::vector<std::string_view> &fields,
                         std::string_view &rest) {
  fields.clear();
  size_t pos = 0;
  for (size_t i = 0; i < n; ++i) {
    auto sp = line.find(' ', pos);
    if (sp == std::string_view::npos)
      return false;
    fields.push_back(line.substr(pos, sp - pos));
    pos = sp + 1;
  }
  rest = line.substr(pos);
  return !rest.empty();
}

static bool is_mode(std::string_view s) {
  if (s.size() != 6)
    return false;
  for (char c : s)
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  return true;
}

static bool is_hex(std::string_view s) {
  if (s.empty())
    return false;
  for (char c : s)
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
      return false;
  return true;
}

static bool parse_count(std::string_view s, long &out) {
  if (s.empty())
    return false;
  auto res = std::from_chars(s.data(), s.data() + s.size(), out);
  return res.ec == std::errc() && res.ptr == s.data() + s.size() && out >= 0;
}

static std::optional<ChangeRecord> parse_ordinary(std::string_view line) {
  std::vector<std::string_view> f;
  std::string_view path;
  if (!split_fields(line, 8, f, path))
    return std::nullopt;
  if (f[1].size() != 2 || f[2].size() != 4 || !is_mode(f[3]) ||
      !is_mode(f[4]) || !is_mode(f[5]) || !is_hex(f[6]) || !is_hex(f[7]))
    return std::nullopt;
  ChangeRecord r;
  r.kind = ChangeKind::Ordinary;
  r.index = f[1][0];
  r.worktree = f[1][1];
  r.path = std::string(path);
  return r;
}

static std::optional<ChangeRecord> parse_rename(std::string_view line) {
  std::vector<std::string_view> f;
  std::string_view rest;
  if (!split_fields(line, 9, f, rest))
    return std::nullopt;
  if (f[1].size() != 2 || f[2].size() != 4 || !is_mode(f[3]) ||
      !is_mode(f[4]) || !is_mode(f[5]) || !is_hex(f[6]) || !is_hex(f[7]))
    return std::nullopt;

  auto xs = f[8];
  if (xs.size() < 2 || xs.size() > 4 || (xs[0] != 'R' && xs[0] != 'C'))
    return std::nullopt;
  long score = 0;
  if (!parse_count(xs.substr(1), score))
    return std::nullopt;

  auto tab = rest.rfind('\t');
  if (tab == std::string_view::npos || tab == 0 || tab + 1 >= rest.size())
    return std::nullopt;

  ChangeRecord r;
  r.kind = ChangeKind::RenameOrCopy;
  r.index = f[1][0];
  r.worktree = f[1][1];
  r.path = std::string(rest.substr(0, tab));
  r.orig_path = std::string(rest.substr(tab + 1));
  r.rename_mark = xs[0];
  r.score = static_cast<int>(score);
  return r;
}

static std::optional<ChangeRecord> parse_unmerged(std::string_view line) {
  std::vector<std::string_view> f;
  std::string_view path;
  if (!split_fields(line, 10, f, path))
    return std::nullopt;
  if (f[1].size() != 2 || f[2].size() != 4)
    return std::nullopt;
  for (size_t i = 3; i <= 6; ++i)
    if (!is_mode(f[i]))
      return std::nullopt;
  for (size_t i = 7; i <= 9; ++i)
    if (!is_hex(f[i]))
      return std::nullopt;
  ChangeRecord r;
  r.kind = ChangeKind::Unmerged;
  r.index = f[1][0];
  r.worktree = f[1][1];
  r.path = std::string(path);
  return r;
}

static std::optional<ChangeRecord> parse_path_only(std::string_view line,
                                                   ChangeKind kind) {
  auto path = line.substr(2);
  if (path.empty())
    return std::nullopt;
  ChangeRecord r;
  r.kind = kind;
  r.index = line[0];
  r.worktree = line[0];
  r.path = std::string(path);
  return r;
}

static void parse_branch_line(std::string_view line, BranchInfo &b) {
  auto value = [&](std::string_view prefix) -> std::optional<std::string> {
    auto v = line.substr(prefix.size());
    if (v.empty())
      return std::nullopt;
    return std::string(v);
  };

  if (starts_with(line, "# branch.oid ")) {
    if (auto v = value("# branch.oid "))
      b.oid = v;
  } else if (starts_with(line, "# branch.head ")) {
    if (auto v = value("# branch.head "))
      b.head = v;
  } else if (starts_with(line, "# branch.upstream ")) {
    if (auto v = value("# branch.upstream "))
      b.upstream = v;
  } else if (starts_with(line, "# branch.ab ")) {
    // "# branch.ab +<ahead> -<behind>"
    auto rest = line.substr(std::string_view("# branch.ab ").size());
    auto sp = rest.find(' ');
    if (sp == std::string_view::npos)
      return;
    auto a = rest.substr(0, sp);
    auto d = rest.substr(sp + 1);
    long ahead = 0, behind = 0;
    if (a.size() < 2 || a[0] != '+' || d.size() < 2 || d[0] != '-')
      return;
    if (!parse_count(a.substr(1), ahead) || !parse_count(d.substr(1), behind))
      return;
    b.ahead = ahead;
    b.behind = behind;
  }
}

std::optional<ChangeRecord> parse_status_line(std::string_view line,
                                              BranchInfo &branch) {
  if (starts_with(line, "# ")) {
    parse_branch_line(line, branch);
    return std::nullopt;
  }
  if (starts_with(line, "1 "))
    return parse_ordinary(line);
  if (starts_with(line, "2 "))
    return parse_rename(line);
  if (starts_with(line, "u "))
    return parse_unmerged(line);
  if (starts_with(line, "? "))
    return parse_path_only(line, ChangeKind::Untracked);
  if (starts_with(line, "! "))
    return parse_path_only(line, ChangeKind::Ignored);
  return std::nullopt;
}

StatusSummary parse_status(std::string_view body) {
  StatusSummary s;
  size_t pos = 0;
  while (pos < body.size()) {
    auto nl = body.find('\n', pos);
    if (nl == std::string_view::npos)
      nl = body.size();
    auto line = body.substr(pos, nl - pos);
    pos = nl + 1;
    if (line.empty())
      continue;

    auto rec = parse_status_line(line, s.branch);
    if (!rec)
      continue;
    switch (rec->kind) {
    case ChangeKind::Untracked:
      s.not_added.push_back(std::move(rec->path));
      break;
    case ChangeKind::Ignored:
      s.ignored.push_back(std::move(rec->path));
      break;
    default:
      s.files.push_back(std::move(*rec));
      break;
    }
  }
  return s;
}

std::optional<std::string> current_branch(const StatusSummary &summary) {
  const auto &head = summary.branch.head;
  if (!head || head->empty() || *head == "(detached)" || *head == "(initial)")
    return std::nullopt;
  return head;
}

} // namespace gitscope
