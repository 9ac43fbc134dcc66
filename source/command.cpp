#include <gitscope/command.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <cstring>
#include <string_view>

extern char **environ;

namespace fs = std::filesystem;

namespace gitscope {

const char *to_string(ErrorKind k) {
  switch (k) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::SpawnFailed:
    return "spawn-failed";
  case ErrorKind::TimedOut:
    return "timed-out";
  case ErrorKind::Signaled:
    return "signaled";
  case ErrorKind::NonZeroExit:
    return "non-zero-exit";
  case ErrorKind::Invalid:
    return "invalid";
  case ErrorKind::NotFound:
    return "not-found";
  }
  return "unknown";
}

CommandResult CommandResult::failure(ErrorKind kind, std::string message) {
  CommandResult r;
  r.success = false;
  r.kind = kind;
  r.error = std::move(message);
  return r;
}

std::string join_args(const std::vector<std::string> &argv) {
  std::string s;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i)
      s += ' ';
    s += argv[i];
  }
  return s;
}

static int safe_pipe(int fds[2]) { return ::pipe2(fds, O_CLOEXEC); }

static void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

// Окружение дочернего процесса: стабильные (английские) диагностики git и
// никаких интерактивных запросов пароля.
static std::vector<std::string> child_environment() {
  std::vector<std::string> env;
  for (char **e = environ; e && *e; ++e) {
    std::string_view kv(*e);
    if (kv.rfind("LC_ALL=", 0) == 0 || kv.rfind("GIT_TERMINAL_PROMPT=", 0) == 0)
      continue;
    env.emplace_back(kv);
  }
  env.emplace_back("LC_ALL=C");
  env.emplace_back("GIT_TERMINAL_PROMPT=0");
  return env;
}

enum ChildStage : int { kStageChdir = 0, kStageExec = 1 };

static CommandResult run_command_impl(const std::vector<std::string> &args,
                                      const fs::path &cwd,
                                      std::chrono::milliseconds timeout) {
  CommandResult res{};

  // всё, что нужно ребёнку, готовим до fork()
  std::vector<char *> argv_c;
  argv_c.reserve(args.size() + 1);
  for (auto &s : args)
    argv_c.push_back(const_cast<char *>(s.c_str()));
  argv_c.push_back(nullptr);

  auto env = child_environment();
  std::vector<char *> env_c;
  env_c.reserve(env.size() + 1);
  for (auto &s : env)
    env_c.push_back(s.data());
  env_c.push_back(nullptr);

  const std::string cwd_str = cwd.string();

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  auto close_all = [&] {
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[0]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[0]);
    close_fd(exec_pipe[1]);
  };

  if (safe_pipe(out_pipe) != 0 || safe_pipe(err_pipe) != 0 ||
      safe_pipe(exec_pipe) != 0) {
    int e = errno;
    close_all();
    return CommandResult::failure(ErrorKind::SpawnFailed,
                                  fmt::format("pipe failed: {}", strerror(e)));
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    int e = errno;
    close_all();
    return CommandResult::failure(ErrorKind::SpawnFailed,
                                  fmt::format("fork failed: {}", strerror(e)));
  }

  if (pid == 0) {
    ::close(out_pipe[0]);
    ::close(err_pipe[0]);
    ::close(exec_pipe[0]);

    if (!cwd_str.empty() && ::chdir(cwd_str.c_str()) != 0) {
      int payload[2] = {kStageChdir, errno};
      (void)!::write(exec_pipe[1], payload, sizeof(payload));
      _exit(127);
    }

    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    ::execvpe(argv_c[0], argv_c.data(), env_c.data());

    int payload[2] = {kStageExec, errno};
    (void)!::write(exec_pipe[1], payload, sizeof(payload));
    _exit(127);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);

  auto reap = [pid]() {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return status;
  };

  // exec_pipe закрывается по O_CLOEXEC при успешном exec
  int payload[2] = {0, 0};
  ssize_t n = 0;
  do {
    n = ::read(exec_pipe[0], payload, sizeof(payload));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(payload))) {
    close_all();
    (void)reap();
    std::string msg =
        payload[0] == kStageChdir
            ? fmt::format("cannot enter {}: {}", cwd_str, strerror(payload[1]))
            : fmt::format("cannot execute {}: {}", args[0],
                          strerror(payload[1]));
    spdlog::warn("[cmd] {}", msg);
    auto r = CommandResult::failure(ErrorKind::SpawnFailed, msg);
    r.err = msg;
    return r;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::array<pollfd, 2> fds{};
  fds[0] = {out_pipe[0], POLLIN, 0};
  fds[1] = {err_pipe[0], POLLIN, 0};
  int open_fds = 2;
  bool timed_out = false;
  bool io_failed = false;
  int poll_errno = 0;
  std::array<char, 4096> buf{};

  while (open_fds > 0) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now())
                    .count();
    if (left <= 0) {
      timed_out = true;
      break;
    }
    int rc = ::poll(fds.data(), fds.size(),
                    static_cast<int>(std::min<long long>(left, INT_MAX)));
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      io_failed = true;
      poll_errno = errno;
      break;
    }
    if (rc == 0)
      continue;

    for (size_t i = 0; i < fds.size(); ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t got = ::read(fds[i].fd, buf.data(), buf.size());
      if (got > 0) {
        (i == 0 ? res.out : res.err).append(buf.data(),
                                            static_cast<size_t>(got));
      } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
        ::close(fds[i].fd);
        fds[i].fd = -1;
        --open_fds;
      }
    }
  }

  if (timed_out || io_failed)
    ::kill(pid, SIGKILL);
  for (auto &p : fds)
    close_fd(p.fd);
  out_pipe[0] = err_pipe[0] = -1;
  int status = reap();

  if (timed_out) {
    spdlog::warn("[cmd] {} timed out after {}ms", join_args(args),
                 timeout.count());
    res.kind = ErrorKind::TimedOut;
    res.exit_code = -1;
    res.error = "Command timed out";
    return res;
  }
  if (io_failed) {
    res.kind = ErrorKind::SpawnFailed;
    res.exit_code = -1;
    res.error = fmt::format("poll failed: {}", strerror(poll_errno));
    return res;
  }

  if (WIFEXITED(status)) {
    int code = WEXITSTATUS(status);
    res.exit_code = code;
    if (code == 0) {
      res.success = true;
      return res;
    }
    res.kind = ErrorKind::NonZeroExit;
    res.error = fmt::format("Command failed: {} (exit {})", join_args(args), code);
    if (res.err.empty())
      res.err = res.error;
    return res;
  }
  if (WIFSIGNALED(status)) {
    int sig = WTERMSIG(status);
    res.exit_code = 128 + sig;
    res.kind = ErrorKind::Signaled;
    res.error = fmt::format("Command killed by signal {}", sig);
    return res;
  }

  res.kind = ErrorKind::SpawnFailed;
  res.exit_code = -1;
  res.error = "Command ended in an unknown state";
  return res;
}

CommandResult run_command(const std::vector<std::string> &argv,
                          const fs::path &cwd,
                          std::chrono::milliseconds timeout) {
  if (argv.empty())
    return CommandResult::failure(ErrorKind::Invalid, "empty argv");
  // steady_clock считает в наносекундах: большие значения переполняют deadline
  timeout = std::clamp<std::chrono::milliseconds>(
      timeout, std::chrono::milliseconds::zero(), kMaxTimeout);
  try {
    return run_command_impl(argv, cwd, timeout);
  } catch (const std::exception &e) {
    spdlog::warn("[cmd] {}: {}", join_args(argv), e.what());
    return CommandResult::failure(ErrorKind::SpawnFailed, e.what());
  }
}

} // namespace gitscope
