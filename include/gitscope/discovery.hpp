#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gitscope {

struct DiscoveredRepo {
  std::filesystem::path absolute_path;
  std::string relative_path; // posix-style, always strictly inside the root
};

inline bool operator==(const DiscoveredRepo &a, const DiscoveredRepo &b) {
  return a.absolute_path == b.absolute_path &&
         a.relative_path == b.relative_path;
}

struct DiscoveryLimits {
  int max_depth = 4;
  std::size_t max_directories = 2000;
  std::size_t max_repos = 64;
};

bool has_git_metadata(const std::filesystem::path &dir);
bool is_pruned_directory(const std::string &name);

// BFS по дереву каталогов: ищет вложенные репозитории (сам root не считается),
// в найденный репозиторий не спускается. Результат отсортирован по relative_path.
std::vector<DiscoveredRepo>
discover_nested_repos(const std::filesystem::path &root,
                      const DiscoveryLimits &limits = {});

class DiscoveryCache {
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  explicit DiscoveryCache(std::chrono::milliseconds ttl, NowFn now = {});

  std::optional<std::vector<DiscoveredRepo>> get(const std::string &root) const;
  void put(const std::string &root, std::vector<DiscoveredRepo> repos);
  void clear();

  std::vector<DiscoveredRepo> get_or_scan(const std::filesystem::path &root,
                                          const DiscoveryLimits &limits);

  std::chrono::milliseconds ttl() const { return ttl_; }

private:
  struct Entry {
    std::vector<DiscoveredRepo> repos;
    Clock::time_point expires_at;
  };

  Clock::time_point now() const { return now_ ? now_() : Clock::now(); }

  std::chrono::milliseconds ttl_;
  NowFn now_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace gitscope
