#include <cerrno>
#include <cstdlib>
#include <gitscope/cli.hpp>
#include <string_view>

namespace gitscope {

static bool has_arg(size_t i, size_t n) { return i + 1 < n; }

static bool to_number(const std::string &s, long &out) {
  if (s.empty())
    return false;
  char *end = nullptr;
  errno = 0;
  long v = std::strtol(s.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || v < 0)
    return false;
  out = v;
  return true;
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i)
    args.emplace_back(argv[i]);

  // глобальные опции и опции команд можно перемешивать
  QueryOpts q;
  bool staged = false;
  bool json = false;
  std::vector<std::string> positional;

  for (size_t i = 0; i < args.size(); ++i) {
    std::string_view a = args[i];
    if (a == "--root" && has_arg(i, args.size())) {
      r.global.root = args[++i];
    } else if (a == "--workers" && has_arg(i, args.size())) {
      long n = 0;
      if (!to_number(args[++i], n)) {
        r.error = "--workers: expected a non-negative number";
        return r;
      }
      r.global.workers = static_cast<unsigned>(n);
    } else if (a == "--verbose" || a == "-v") {
      r.global.verbose = true;
    } else if (a == "--cwd" && has_arg(i, args.size())) {
      q.cwd = args[++i];
    } else if (a == "--timeout-ms" && has_arg(i, args.size())) {
      long n = 0;
      if (!to_number(args[++i], n)) {
        r.error = "--timeout-ms: expected a non-negative number";
        return r;
      }
      q.timeout_ms = n;
    } else if (a == "--staged" || a == "--cached") {
      staged = true;
    } else if (a == "--json") {
      json = true;
    } else if (a == "--help" || a == "-h") {
      r.cmd = CmdHelp{};
      return r;
    } else if (a == "--version") {
      r.cmd = CmdVersion{};
      return r;
    } else if (a.size() > 1 && a[0] == '-') {
      r.error = "unknown option: " + args[i];
      return r;
    } else {
      positional.push_back(args[i]);
    }
  }

  if (positional.empty()) {
    r.cmd = CmdHelp{};
    return r;
  }

  const std::string cmd = positional[0];
  if (cmd == "help") {
    r.cmd = CmdHelp{};
  } else if (cmd == "version") {
    r.cmd = CmdVersion{};
  } else if (cmd == "status") {
    r.cmd = CmdStatus{q};
  } else if (cmd == "numstat") {
    r.cmd = CmdNumstat{q, staged};
  } else if (cmd == "diff") {
    if (positional.size() < 2) {
      r.error = "diff: file path required";
      return r;
    }
    r.cmd = CmdDiff{q, positional[1], staged};
  } else if (cmd == "files") {
    r.cmd = CmdFiles{q, json};
  } else if (cmd == "repos") {
    r.cmd = CmdRepos{q};
  } else {
    r.error = "unknown command: " + cmd;
  }
  return r;
}

} // namespace gitscope
