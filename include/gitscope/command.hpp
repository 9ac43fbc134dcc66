#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitscope {

enum class ErrorKind {
  None,
  SpawnFailed,
  TimedOut,
  Signaled,
  NonZeroExit,
  Invalid,
  NotFound
};

const char *to_string(ErrorKind k);

// Результат одного запуска внешней команды. out/err заполнены даже при ошибке.
struct CommandResult {
  bool success{false};
  std::string out;
  std::string err;
  std::optional<int> exit_code;
  ErrorKind kind{ErrorKind::None};
  std::string error;

  static CommandResult failure(ErrorKind kind, std::string message);
};

inline constexpr std::chrono::milliseconds kDefaultTimeout{10000};
inline constexpr std::chrono::milliseconds kMaxTimeout = std::chrono::hours(24);

// argv[0] ищется в PATH. timeout ограничен kMaxTimeout. Никогда не бросает
// исключений.
CommandResult run_command(const std::vector<std::string> &argv,
                          const std::filesystem::path &cwd,
                          std::chrono::milliseconds timeout = kDefaultTimeout);

std::string join_args(const std::vector<std::string> &argv);

} // namespace gitscope
