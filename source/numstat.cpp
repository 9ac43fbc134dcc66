#include <gitscope/numstat.hpp>
#include <gitscope/sections.hpp>

#include <charconv>

namespace gitscope {

static bool parse_column(std::string_view s, long &value, bool &dash) {
  if (s == "-") {
    dash = true;
    value = 0;
    return true;
  }
  if (s.empty())
    return false;
  for (char c : s)
    if (c < '0' || c > '9')
      return false;
  auto res = std::from_chars(s.data(), s.data() + s.size(), value);
  return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

std::optional<DiffFileStat> parse_numstat_line(std::string_view line) {
  auto t1 = line.find('\t');
  if (t1 == std::string_view::npos)
    return std::nullopt;
  auto t2 = line.find('\t', t1 + 1);
  if (t2 == std::string_view::npos)
    return std::nullopt;

  long ins = 0, del = 0;
  bool ins_dash = false, del_dash = false;
  if (!parse_column(line.substr(0, t1), ins, ins_dash) ||
      !parse_column(line.substr(t1 + 1, t2 - t1 - 1), del, del_dash))
    return std::nullopt;

  DiffFileStat st;
  st.path = std::string(line.substr(t2 + 1));
  st.binary = ins_dash || del_dash;
  st.insertions = st.binary ? 0 : ins;
  st.deletions = st.binary ? 0 : del;
  st.changes = st.insertions + st.deletions;
  return st;
}

DiffSummary parse_numstat(std::string_view body) {
  DiffSummary sum;
  auto text = trim(body);
  std::string_view v(text);
  size_t pos = 0;
  while (pos < v.size()) {
    auto nl = v.find('\n', pos);
    if (nl == std::string_view::npos)
      nl = v.size();
    auto line = v.substr(pos, nl - pos);
    pos = nl + 1;
    if (line.empty())
      continue;
    auto st = parse_numstat_line(line);
    if (!st)
      continue;
    sum.insertions += st->insertions;
    sum.deletions += st->deletions;
    sum.changes += st->changes;
    sum.changed += 1;
    sum.files.push_back(std::move(*st));
  }
  return sum;
}

static void collapse_slashes(std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '/' && !out.empty() && out.back() == '/')
      continue;
    out.push_back(c);
  }
  s.swap(out);
}

// Заменяет каждую группу "{a => b}" на a (old) и b (new).
static bool expand_braces(std::string_view s, std::string &old_out,
                          std::string &new_out) {
  bool replaced = false;
  size_t pos = 0;
  while (pos < s.size()) {
    auto open = s.find('{', pos);
    if (open == std::string_view::npos)
      break;
    auto close = s.find('}', open + 1);
    if (close == std::string_view::npos)
      break;
    auto inner = s.substr(open + 1, close - open - 1);
    auto nested = inner.find('{');
    auto arrow = inner.find("=>");
    if (nested != std::string_view::npos || arrow == std::string_view::npos) {
      old_out.append(s.substr(pos, open + 1 - pos));
      new_out.append(s.substr(pos, open + 1 - pos));
      pos = open + 1;
      continue;
    }
    auto prefix = s.substr(pos, open - pos);
    old_out.append(prefix);
    new_out.append(prefix);
    old_out += trim(inner.substr(0, arrow));
    new_out += trim(inner.substr(arrow + 2));
    replaced = true;
    pos = close + 1;
  }
  if (pos < s.size()) {
    old_out.append(s.substr(pos));
    new_out.append(s.substr(pos));
  }
  return replaced;
}

NumstatPaths normalize_numstat_path(std::string_view raw) {
  auto trimmed = trim(raw);
  NumstatPaths p;

  bool has_arrow = trimmed.find("=>") != std::string::npos;
  if (has_arrow && trimmed.find('{') != std::string::npos &&
      trimmed.find('}') != std::string::npos) {
    std::string old_path, new_path;
    if (expand_braces(trimmed, old_path, new_path)) {
      // "dir/{ => sub}/f" даёт "dir//f" для старого пути
      collapse_slashes(old_path);
      collapse_slashes(new_path);
      p.new_path = std::move(new_path);
      p.old_path = std::move(old_path);
    } else {
      p.new_path = trimmed;
    }
    return p;
  }

  if (has_arrow) {
    auto first = trimmed.find("=>");
    auto last = trimmed.rfind("=>");
    auto old_path = trim(std::string_view(trimmed).substr(0, first));
    auto new_path = trim(std::string_view(trimmed).substr(last + 2));
    if (!new_path.empty()) {
      p.new_path = std::move(new_path);
      p.old_path = std::move(old_path);
      return p;
    }
  }

  p.new_path = trimmed;
  return p;
}

DiffStatsMap make_stats_map(const DiffSummary &summary) {
  DiffStatsMap stats;
  for (const auto &f : summary.files) {
    auto paths = normalize_numstat_path(f.path);
    DiffStat st{f.insertions, f.deletions, f.binary};
    stats[f.path] = st;
    if (!paths.new_path.empty() && paths.new_path != f.path)
      stats[paths.new_path] = st;
    if (paths.old_path && !paths.old_path->empty() && *paths.old_path != f.path &&
        *paths.old_path != paths.new_path)
      stats[*paths.old_path] = st;
  }
  return stats;
}

} // namespace gitscope
