#include <gitscope/discovery.hpp>
#include <gitscope/pathcheck.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace fs = std::filesystem;

namespace gitscope {

static const std::unordered_set<std::string> kSkippedDirectories = {
    ".git",  "node_modules", ".idea",   ".vscode", "dist",        "build",
    "target", ".next",       ".cache",  ".turbo",  ".pnpm-store", "coverage"};

bool is_pruned_directory(const std::string &name) {
  if (kSkippedDirectories.count(name))
    return true;
  return !name.empty() && name.front() == '.';
}

bool has_git_metadata(const fs::path &dir) {
  std::error_code ec;
  auto st = fs::symlink_status(dir / ".git", ec);
  if (ec)
    return false;
  // .git бывает и файлом (worktree, submodule)
  return st.type() == fs::file_type::directory ||
         st.type() == fs::file_type::regular;
}

std::vector<DiscoveredRepo> discover_nested_repos(const fs::path &root,
                                                  const DiscoveryLimits &limits) {
  struct Item {
    fs::path path;
    int depth;
  };
  std::vector<Item> queue{{root, 0}};
  std::vector<DiscoveredRepo> found;
  std::size_t scanned = 0;

  for (std::size_t i = 0; i < queue.size(); ++i) {
    if (found.size() >= limits.max_repos) {
      spdlog::debug("[discover] repo limit {} reached under {}",
                    limits.max_repos, root.string());
      break;
    }
    if (scanned >= limits.max_directories) {
      spdlog::debug("[discover] directory limit {} reached under {}",
                    limits.max_directories, root.string());
      break;
    }

    const Item cur = queue[i];
    ++scanned;

    if (cur.depth > 0 && has_git_metadata(cur.path)) {
      auto rel = to_posix(cur.path.lexically_relative(root));
      if (!rel.empty() && rel != "." && rel.rfind("..", 0) != 0)
        found.push_back({cur.path, rel});
      continue;
    }

    if (cur.depth >= limits.max_depth)
      continue;

    std::error_code ec;
    fs::directory_iterator it(cur.path, ec);
    if (ec) {
      spdlog::debug("[discover] cannot read {}: {}", cur.path.string(),
                    ec.message());
      continue;
    }

    // порядок readdir не определён: сортируем, чтобы лимиты срабатывали одинаково
    std::vector<std::string> names;
    for (auto end = fs::directory_iterator(); it != end; it.increment(ec)) {
      if (ec)
        break;
      std::error_code sec;
      // симлинки не разворачиваем
      if (!it->is_directory(sec) || it->is_symlink(sec))
        continue;
      auto name = it->path().filename().string();
      if (is_pruned_directory(name))
        continue;
      names.push_back(std::move(name));
    }
    std::sort(names.begin(), names.end());
    for (auto &name : names)
      queue.push_back({cur.path / name, cur.depth + 1});
  }

  std::sort(found.begin(), found.end(),
            [](const DiscoveredRepo &a, const DiscoveredRepo &b) {
              return a.relative_path < b.relative_path;
            });
  spdlog::debug("[discover] {}: {} repos, {} directories scanned",
                root.string(), found.size(), scanned);
  return found;
}

DiscoveryCache::DiscoveryCache(std::chrono::milliseconds ttl, NowFn now)
    : ttl_(ttl), now_(std::move(now)) {}

std::optional<std::vector<DiscoveredRepo>>
DiscoveryCache::get(const std::string &root) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(root);
  if (it == entries_.end() || it->second.expires_at <= now())
    return std::nullopt;
  return it->second.repos;
}

void DiscoveryCache::put(const std::string &root,
                         std::vector<DiscoveredRepo> repos) {
  std::lock_guard<std::mutex> lk(mu_);
  entries_[root] = Entry{std::move(repos), now() + ttl_};
}

void DiscoveryCache::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  entries_.clear();
}

std::vector<DiscoveredRepo>
DiscoveryCache::get_or_scan(const fs::path &root,
                            const DiscoveryLimits &limits) {
  const auto key = root.string();
  if (auto hit = get(key)) {
    spdlog::debug("[discover] cache hit for {}", key);
    return *hit;
  }
  spdlog::debug("[discover] cache miss for {}", key);
  auto repos = discover_nested_repos(root, limits);
  put(key, repos);
  return repos;
}

} // namespace gitscope
