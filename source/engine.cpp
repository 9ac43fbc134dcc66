#include <gitscope/engine.hpp>
#include <gitscope/sections.hpp>
#include <gitscope/thread_pool.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace gitscope {

static const char *const kNotARepoPhrases[] = {
    "not a git repository",
    "use --no-index to compare two paths outside a working tree",
    "usage: git diff --no-index",
    "unknown option `cached", // git quotes it as `cached'
};

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool looks_like_not_a_repository(const CommandResult &r) {
  if (r.success)
    return false;
  const auto details = lower(r.error + "\n" + r.err);
  for (const char *phrase : kNotARepoPhrases)
    if (details.find(phrase) != std::string::npos)
      return true;
  return false;
}

std::vector<std::string> status_args() {
  return {"status", "--porcelain=v2", "--branch", "--untracked-files=all"};
}

std::vector<std::string> numstat_args(bool staged) {
  if (staged)
    return {"diff", "--cached", "--numstat"};
  return {"diff", "--numstat"};
}

std::vector<std::string> diff_file_args(const std::string &path, bool staged) {
  if (staged)
    return {"diff", "--cached", "--no-ext-diff", "--", path};
  return {"diff", "--no-ext-diff", "--", path};
}

static std::string join_lines(const std::vector<std::string> &xs) {
  std::string s;
  for (size_t i = 0; i < xs.size(); ++i) {
    if (i)
      s += '\n';
    s += xs[i];
  }
  return s;
}

static std::string describe_failure(const CommandResult &r, const char *what) {
  auto err = trim(r.err);
  auto nl = err.find('\n');
  if (nl != std::string::npos)
    err.resize(nl);
  if (r.error.empty())
    return err.empty() ? fmt::format("{} failed", what) : err;
  if (err.empty() || err == r.error)
    return r.error;
  return fmt::format("{}: {}", r.error, err);
}

Engine::Engine(EngineConfig cfg, RunFn run, PathValidator validator,
               DiscoveryCache::NowFn now)
    : cfg_(std::move(cfg)), run_(std::move(run)),
      validator_(std::move(validator)),
      cache_(cfg_.discovery_ttl, std::move(now)) {
  cfg_.root = resolve_against(fs::current_path(),
                              cfg_.root.empty() ? fs::current_path() : cfg_.root);
  if (!run_) {
    run_ = [exe = cfg_.git_executable](const std::vector<std::string> &args,
                                       const fs::path &cwd,
                                       std::chrono::milliseconds timeout) {
      std::vector<std::string> argv;
      argv.reserve(args.size() + 1);
      argv.push_back(exe);
      argv.insert(argv.end(), args.begin(), args.end());
      return run_command(argv, cwd, timeout);
    };
  }
  if (!validator_)
    validator_ = validate_path;
}

Engine::Resolved
Engine::resolve_cwd(const std::optional<fs::path> &requested) const {
  const fs::path cwd = requested.value_or(cfg_.root);
  auto check = validator_(cwd, cfg_.root);
  if (!check.valid) {
    return {cwd, CommandResult::failure(
                     ErrorKind::Invalid,
                     check.error.value_or("Invalid working directory"))};
  }
  return {resolve_against(cfg_.root, cwd), std::nullopt};
}

std::chrono::milliseconds
Engine::timeout_of(const std::optional<std::chrono::milliseconds> &t) const {
  return t.value_or(cfg_.timeout);
}

CommandResult Engine::fan_out(const fs::path &base,
                              const std::vector<std::string> &args,
                              std::chrono::milliseconds timeout,
                              const char *what) {
  const auto repos = cache_.get_or_scan(base, cfg_.limits);
  if (repos.empty())
    return CommandResult::failure(ErrorKind::NotFound, kNoNestedRepos);

  std::vector<CommandResult> results(repos.size());
  const auto workers = static_cast<unsigned>(
      std::min<std::size_t>(cfg_.fan_out_workers, repos.size()));
  // исключение одного репозитория не должно терять остальные секции
  auto run_one = [&](size_t i) {
    try {
      results[i] = run_(args, repos[i].absolute_path, timeout);
    } catch (const std::exception &e) {
      results[i] = CommandResult::failure(ErrorKind::SpawnFailed, e.what());
    }
  };
  if (workers <= 1) {
    for (size_t i = 0; i < repos.size(); ++i)
      run_one(i);
  } else {
    // результаты пишутся по индексу отсортированного списка: порядок секций
    // тот же, что и при последовательном обходе
    ThreadPool pool(workers);
    for (size_t i = 0; i < repos.size(); ++i) {
      pool.submit([&run_one, i] { run_one(i); });
    }
    pool.wait_idle();
  }

  std::vector<std::string> outputs;
  std::vector<std::string> errors;
  const CommandResult *first_failure = nullptr;
  for (size_t i = 0; i < repos.size(); ++i) {
    const auto &res = results[i];
    if (!res.success) {
      errors.push_back(fmt::format("[{}] {}", repos[i].relative_path,
                                   describe_failure(res, what)));
      spdlog::warn("[fallback] {}", errors.back());
      if (!first_failure)
        first_failure = &res;
      continue;
    }
    outputs.push_back(wrap_section(repos[i].relative_path, res.out));
  }

  if (outputs.empty()) {
    auto r = CommandResult::failure(first_failure ? first_failure->kind
                                                  : ErrorKind::NonZeroExit,
                                    errors.front());
    r.err = join_lines(errors);
    return r;
  }

  CommandResult ok;
  ok.success = true;
  ok.out = join_lines(outputs);
  ok.err = join_lines(errors);
  ok.exit_code = 0;
  return ok;
}

CommandResult Engine::status(const StatusRequest &req) {
  try {
    auto r = resolve_cwd(req.cwd);
    if (r.error)
      return *r.error;
    const auto t = timeout_of(req.timeout);
    const auto args = status_args();
    auto res = run_(args, r.cwd, t);
    if (res.success || !looks_like_not_a_repository(res))
      return res;
    spdlog::info("[fallback] {} is not a git repository, trying nested repos",
                 r.cwd.string());
    return fan_out(r.cwd, args, t, "status");
  } catch (const std::exception &e) {
    return CommandResult::failure(ErrorKind::SpawnFailed,
                                  fmt::format("git status failed: {}", e.what()));
  }
}

CommandResult Engine::diff_numstat(const NumstatRequest &req) {
  try {
    auto r = resolve_cwd(req.cwd);
    if (r.error)
      return *r.error;
    const auto t = timeout_of(req.timeout);
    const auto args = numstat_args(req.staged);
    auto res = run_(args, r.cwd, t);
    if (res.success || !looks_like_not_a_repository(res))
      return res;
    spdlog::info("[fallback] {} is not a git repository, trying nested repos",
                 r.cwd.string());
    return fan_out(r.cwd, args, t, "diff");
  } catch (const std::exception &e) {
    return CommandResult::failure(ErrorKind::SpawnFailed,
                                  fmt::format("git diff failed: {}", e.what()));
  }
}

CommandResult Engine::diff_file_nested(const fs::path &base,
                                       const std::string &file_path,
                                       bool staged,
                                       std::chrono::milliseconds timeout) {
  const auto repos = cache_.get_or_scan(base, cfg_.limits);
  if (repos.empty())
    return CommandResult::failure(ErrorKind::NotFound, kNoNestedRepos);

  const auto abs = resolve_against(base, file_path);
  const DiscoveredRepo *target = nullptr;
  for (const auto &repo : repos) {
    if (!is_path_inside(abs, repo.absolute_path))
      continue;
    // самый глубокий (длинный) путь выигрывает
    if (!target || repo.absolute_path.native().size() >
                       target->absolute_path.native().size())
      target = &repo;
  }
  if (!target) {
    return CommandResult::failure(
        ErrorKind::NotFound,
        fmt::format("File '{}' is not inside a nested git repository",
                    file_path));
  }

  const auto rel = abs.lexically_relative(target->absolute_path);
  if (rel.empty() || rel == "." || rel.is_absolute() || *rel.begin() == "..") {
    return CommandResult::failure(
        ErrorKind::Invalid,
        fmt::format("Invalid git diff file path '{}'", file_path));
  }

  spdlog::debug("[fallback] diff {} in {}", to_posix(rel),
                target->relative_path);
  return run_(diff_file_args(to_posix(rel), staged), target->absolute_path,
              timeout);
}

CommandResult Engine::diff_file(const DiffFileRequest &req) {
  try {
    auto r = resolve_cwd(req.cwd);
    if (r.error)
      return *r.error;
    // относительный путь берётся от cwd, проверяется против доверенного root
    const fs::path candidate =
        req.file_path.empty() ? fs::path() : resolve_against(r.cwd, req.file_path);
    auto check = validator_(candidate, cfg_.root);
    if (!check.valid) {
      return CommandResult::failure(ErrorKind::Invalid,
                                    check.error.value_or("Invalid file path"));
    }
    const auto t = timeout_of(req.timeout);
    auto res = run_(diff_file_args(req.file_path, req.staged), r.cwd, t);
    if (res.success || !looks_like_not_a_repository(res))
      return res;
    spdlog::info("[fallback] {} is not a git repository, looking up {}",
                 r.cwd.string(), req.file_path);
    return diff_file_nested(r.cwd, req.file_path, req.staged, t);
  } catch (const std::exception &e) {
    return CommandResult::failure(ErrorKind::SpawnFailed,
                                  fmt::format("git diff failed: {}", e.what()));
  }
}

StatusFilesResult Engine::status_files(const StatusRequest &req) {
  StatusFilesResult out;
  auto st = status(req);
  if (!st.success) {
    out.error = st.error.empty() ? "git status failed" : st.error;
    return out;
  }
  if (auto w = trim(st.err); !w.empty())
    out.warnings.push_back(std::move(w));

  auto numstat = [&](bool staged) -> std::string {
    auto res = diff_numstat({req.cwd, staged, req.timeout});
    if (res.success) {
      if (auto w = trim(res.err); !w.empty())
        out.warnings.push_back(std::move(w));
      return res.out;
    }
    auto msg = fmt::format("{} diff unavailable: {}",
                           staged ? "staged" : "unstaged",
                           describe_failure(res, "diff"));
    spdlog::warn("[files] {}", msg);
    out.warnings.push_back(std::move(msg));
    return {};
  };
  const auto unstaged = numstat(false);
  const auto staged = numstat(true);

  out.files = build_status_files(st.out, unstaged, staged);
  out.success = true;
  return out;
}

std::vector<DiscoveredRepo>
Engine::discovered_repos(const std::optional<fs::path> &cwd) {
  auto r = resolve_cwd(cwd);
  if (r.error) {
    spdlog::warn("[discover] {}", r.error->error);
    return {};
  }
  return cache_.get_or_scan(r.cwd, cfg_.limits);
}

} // namespace gitscope
