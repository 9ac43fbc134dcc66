#include <gitscope/app.hpp>
#include <gitscope/cli.hpp>
#include <gitscope/config.hpp>
#include <gitscope/engine.hpp>
#include <gitscope/report.hpp>
#include <gitscope/sections.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <type_traits>

#ifndef GITSCOPE_VERSION
#define GITSCOPE_VERSION "unknown"
#endif
#ifndef GITSCOPE_COMMIT
#define GITSCOPE_COMMIT "unknown"
#endif

namespace fs = std::filesystem;

namespace gitscope {

static void print_help() {
  std::cout <<
      R"(gitscope - git status/diff across nested repositories

Usage:
  gitscope status             [--cwd DIR] [--timeout-ms N]
  gitscope numstat [--staged] [--cwd DIR] [--timeout-ms N]
  gitscope diff <file> [--staged] [--cwd DIR] [--timeout-ms N]
  gitscope files [--json]     [--cwd DIR] [--timeout-ms N]
  gitscope repos              [--cwd DIR]
  gitscope help | version

Global options:
  --root DIR     trusted root and default working directory (default: .)
  --workers N    run nested repository queries on N workers (default: 1)
  --verbose      debug logging
)";
}

static void configure_logging(bool verbose) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  if (const char *lvl = std::getenv("GITSCOPE_LOG_LEVEL"); lvl && *lvl) {
    // from_str отдаёт off для неизвестных имён
    auto level = spdlog::level::from_str(lvl);
    if (level != spdlog::level::off || std::string(lvl) == "off")
      spdlog::set_level(level);
  }
}

static std::optional<fs::path> to_cwd(const QueryOpts &q) {
  if (!q.cwd)
    return std::nullopt;
  return fs::path(*q.cwd);
}

static std::optional<std::chrono::milliseconds> to_timeout(const QueryOpts &q) {
  if (!q.timeout_ms)
    return std::nullopt;
  return std::chrono::milliseconds(*q.timeout_ms);
}

// raw stdout в stdout, предупреждения частичного отказа в лог
static int emit(const CommandResult &res) {
  if (!res.success) {
    spdlog::error("[app] {}", res.error);
    auto err = trim(res.err);
    if (!err.empty() && err != res.error)
      std::cerr << err << "\n";
    return 1;
  }
  std::cout << res.out;
  if (!res.out.empty() && res.out.back() != '\n')
    std::cout << "\n";
  if (auto w = trim(res.err); !w.empty())
    spdlog::warn("[app] {}", w);
  return 0;
}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv);
  configure_logging(pr.global.verbose);

  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  EngineConfig cfg;
  cfg.root = pr.global.root ? fs::path(*pr.global.root) : fs::current_path();
  apply_env_overrides(cfg);
  if (pr.global.workers)
    cfg.fan_out_workers = *pr.global.workers;

  Engine engine(cfg);
  spdlog::debug("[app] root={} git={} timeout={}ms workers={}",
                engine.config().root.string(), cfg.git_executable,
                cfg.timeout.count(), cfg.fan_out_workers);

  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help();
          return 0;

        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          std::cout << fmt::format("gitscope {} ({})\n", GITSCOPE_VERSION,
                                   GITSCOPE_COMMIT);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdStatus>) {
          return emit(engine.status({to_cwd(c.q), to_timeout(c.q)}));

        } else if constexpr (std::is_same_v<T, CmdNumstat>) {
          return emit(
              engine.diff_numstat({to_cwd(c.q), c.staged, to_timeout(c.q)}));

        } else if constexpr (std::is_same_v<T, CmdDiff>) {
          return emit(engine.diff_file(
              {to_cwd(c.q), c.file, c.staged, to_timeout(c.q)}));

        } else if constexpr (std::is_same_v<T, CmdFiles>) {
          auto res = engine.status_files({to_cwd(c.q), to_timeout(c.q)});
          if (!res.success) {
            spdlog::error("[app] {}", res.error);
            return 1;
          }
          if (c.json) {
            std::cout << render_json(res.files, res.warnings) << "\n";
          } else {
            for (const auto &w : res.warnings)
              spdlog::warn("[app] {}", w);
            std::cout << render_text(res.files);
          }
          return 0;

        } else {
          static_assert(std::is_same_v<T, CmdRepos>);
          std::cout << render_repos(engine.discovered_repos(to_cwd(c.q)));
          return 0;
        }
      },
      *pr.cmd);
}

} // namespace gitscope
