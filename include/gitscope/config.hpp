#pragma once
#include <gitscope/command.hpp>
#include <gitscope/discovery.hpp>

#include <chrono>
#include <filesystem>
#include <string>

namespace gitscope {

struct EngineConfig {
  std::filesystem::path root;
  std::chrono::milliseconds timeout = kDefaultTimeout;
  std::string git_executable = "git";
  DiscoveryLimits limits;
  std::chrono::milliseconds discovery_ttl{3000};
  unsigned fan_out_workers = 1; // 0 и 1: последовательно
};

// GITSCOPE_GIT, GITSCOPE_TIMEOUT_MS, GITSCOPE_DISCOVERY_TTL_MS,
// GITSCOPE_MAX_DEPTH, GITSCOPE_MAX_DIRS, GITSCOPE_MAX_REPOS,
// GITSCOPE_FANOUT_WORKERS
void apply_env_overrides(EngineConfig &cfg);

} // namespace gitscope
