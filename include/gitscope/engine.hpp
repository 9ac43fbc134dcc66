#pragma once
#include <gitscope/aggregate.hpp>
#include <gitscope/command.hpp>
#include <gitscope/config.hpp>
#include <gitscope/discovery.hpp>
#include <gitscope/pathcheck.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gitscope {

struct StatusRequest {
  std::optional<std::filesystem::path> cwd;
  std::optional<std::chrono::milliseconds> timeout;
};

struct NumstatRequest {
  std::optional<std::filesystem::path> cwd;
  bool staged = false;
  std::optional<std::chrono::milliseconds> timeout;
};

struct DiffFileRequest {
  std::optional<std::filesystem::path> cwd;
  std::string file_path;
  bool staged = false;
  std::optional<std::chrono::milliseconds> timeout;
};

struct StatusFilesResult {
  bool success{false};
  std::string error;
  AggregationResult files;
  std::vector<std::string> warnings;
};

inline constexpr const char *kNoNestedRepos =
    "Not a git repository and no nested git repositories were found";

// Эвристика: git не отдаёт отдельного кода для "не репозиторий", поэтому
// распознаём известные фразы в error/stderr (без учёта регистра).
bool looks_like_not_a_repository(const CommandResult &r);

std::vector<std::string> status_args();
std::vector<std::string> numstat_args(bool staged);
std::vector<std::string> diff_file_args(const std::string &path, bool staged);

class Engine {
public:
  // args без имени исполняемого файла
  using RunFn = std::function<CommandResult(const std::vector<std::string> &args,
                                            const std::filesystem::path &cwd,
                                            std::chrono::milliseconds timeout)>;

  explicit Engine(EngineConfig cfg, RunFn run = {}, PathValidator validator = {},
                  DiscoveryCache::NowFn now = {});

  CommandResult status(const StatusRequest &req);
  CommandResult diff_numstat(const NumstatRequest &req);
  CommandResult diff_file(const DiffFileRequest &req);

  // status + unstaged numstat + staged numstat -> build_status_files
  StatusFilesResult status_files(const StatusRequest &req);

  std::vector<DiscoveredRepo>
  discovered_repos(const std::optional<std::filesystem::path> &cwd = {});

  const EngineConfig &config() const { return cfg_; }
  DiscoveryCache &cache() { return cache_; }

private:
  struct Resolved {
    std::filesystem::path cwd;
    std::optional<CommandResult> error;
  };

  Resolved resolve_cwd(const std::optional<std::filesystem::path> &requested) const;
  std::chrono::milliseconds timeout_of(
      const std::optional<std::chrono::milliseconds> &t) const;

  CommandResult fan_out(const std::filesystem::path &base,
                        const std::vector<std::string> &args,
                        std::chrono::milliseconds timeout, const char *what);
  CommandResult diff_file_nested(const std::filesystem::path &base,
                                 const std::string &file_path, bool staged,
                                 std::chrono::milliseconds timeout);

  EngineConfig cfg_;
  RunFn run_;
  PathValidator validator_;
  DiscoveryCache cache_;
};

} // namespace gitscope
