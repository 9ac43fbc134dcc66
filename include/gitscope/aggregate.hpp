#pragma once
#include <gitscope/status_parser.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitscope {

struct AggregatedFileStatus {
  std::string file_name;
  std::string dir_path; // внутри репозитория, без префикса
  std::string full_path;
  std::optional<std::string> repo;
  FileStatus status{FileStatus::Modified};
  bool staged{false};
  long lines_added{0};
  long lines_removed{0};
  std::optional<std::string> old_path;
};

struct RepoBranch {
  std::string name;
  std::optional<std::string> branch;
};

inline bool operator==(const RepoBranch &a, const RepoBranch &b) {
  return a.name == b.name && a.branch == b.branch;
}

struct AggregationResult {
  std::vector<AggregatedFileStatus> staged_files;
  std::vector<AggregatedFileStatus> unstaged_files;
  std::vector<RepoBranch> repos;
  std::optional<std::string> branch;
  std::size_t total_staged{0};
  std::size_t total_unstaged{0};
};

std::string with_repo_prefix(const std::optional<std::string> &repo,
                             const std::string &path);

// status и два numstat (с секциями или legacy) в одно представление;
// порядок секций берётся из status_output, diff сопоставляется по имени репо
AggregationResult build_status_files(std::string_view status_output,
                                     std::string_view unstaged_diff_output,
                                     std::string_view staged_diff_output);

} // namespace gitscope
