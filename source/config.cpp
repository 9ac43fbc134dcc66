#include <gitscope/config.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <optional>

namespace gitscope {

static std::optional<long long> env_number(const char *name) {
  const char *v = std::getenv(name);
  if (!v || !*v)
    return std::nullopt;
  char *end = nullptr;
  errno = 0;
  long long n = std::strtoll(v, &end, 10);
  if (errno != 0 || end == v || *end != '\0' || n < 0) {
    spdlog::warn("[config] ignoring {}={}: not a non-negative number", name, v);
    return std::nullopt;
  }
  return n;
}

void apply_env_overrides(EngineConfig &cfg) {
  if (const char *git = std::getenv("GITSCOPE_GIT"); git && *git)
    cfg.git_executable = git;
  if (auto v = env_number("GITSCOPE_TIMEOUT_MS"))
    cfg.timeout = std::chrono::milliseconds(*v);
  if (auto v = env_number("GITSCOPE_DISCOVERY_TTL_MS"))
    cfg.discovery_ttl = std::chrono::milliseconds(*v);
  if (auto v = env_number("GITSCOPE_MAX_DEPTH"))
    cfg.limits.max_depth = static_cast<int>(*v);
  if (auto v = env_number("GITSCOPE_MAX_DIRS"))
    cfg.limits.max_directories = static_cast<std::size_t>(*v);
  if (auto v = env_number("GITSCOPE_MAX_REPOS"))
    cfg.limits.max_repos = static_cast<std::size_t>(*v);
  if (auto v = env_number("GITSCOPE_FANOUT_WORKERS"))
    cfg.fan_out_workers = static_cast<unsigned>(*v);
}

} // namespace gitscope
