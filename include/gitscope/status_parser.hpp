#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitscope {

struct BranchInfo {
  std::optional<std::string> oid;
  std::optional<std::string> head;
  std::optional<std::string> upstream;
  std::optional<long> ahead;
  std::optional<long> behind;
};

enum class ChangeKind { Ordinary, RenameOrCopy, Unmerged, Untracked, Ignored };

struct ChangeRecord {
  ChangeKind kind{ChangeKind::Ordinary};
  char index{' '};    // X
  char worktree{' '}; // Y
  std::string path;
  std::optional<std::string> orig_path; // только RenameOrCopy
  char rename_mark{0};                  // 'R' или 'C'
  int score{0};
};

struct StatusSummary {
  std::vector<ChangeRecord> files; // Ordinary, RenameOrCopy, Unmerged
  std::vector<std::string> not_added;
  std::vector<std::string> ignored;
  BranchInfo branch;
};

enum class FileStatus { Modified, Added, Deleted, Renamed, Untracked, Conflicted };

const char *to_string(FileStatus s);
FileStatus file_status_from_char(char c);

// Branch pragmas are applied to `branch`; records are returned. Malformed lines
// with a known prefix and unknown lines yield nullopt.
std::optional<ChangeRecord> parse_status_line(std::string_view line,
                                              BranchInfo &branch);

StatusSummary parse_status(std::string_view body);

// "(detached)" и "(initial)" означают отсутствие текущей ветки
std::optional<std::string> current_branch(const StatusSummary &summary);

} // namespace gitscope
