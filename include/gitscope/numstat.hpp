#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gitscope {

struct DiffFileStat {
  std::string path; // как в выводе numstat, включая "{a => b}"
  long insertions{0};
  long deletions{0};
  long changes{0};
  bool binary{false};
};

struct DiffSummary {
  std::vector<DiffFileStat> files;
  long insertions{0};
  long deletions{0};
  long changes{0};
  long changed{0};
};

struct NumstatPaths {
  std::string new_path;
  std::optional<std::string> old_path;
};

struct DiffStat {
  long added{0};
  long removed{0};
  bool binary{false};
};

using DiffStatsMap = std::unordered_map<std::string, DiffStat>;

std::optional<DiffFileStat> parse_numstat_line(std::string_view line);
DiffSummary parse_numstat(std::string_view body);

// "src/{old.txt => new.txt}" and "old => new" rename notations
NumstatPaths normalize_numstat_path(std::string_view raw);

// Indexed by the raw numstat path plus normalized new/old paths when they differ.
DiffStatsMap make_stats_map(const DiffSummary &summary);

} // namespace gitscope
