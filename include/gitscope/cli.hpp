#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gitscope {

struct GlobalOpts {
  std::optional<std::string> root;
  std::optional<unsigned> workers;
  bool verbose = false;
};

struct QueryOpts {
  std::optional<std::string> cwd;
  std::optional<long> timeout_ms;
};

struct CmdStatus {
  QueryOpts q;
};
struct CmdNumstat {
  QueryOpts q;
  bool staged = false;
};
struct CmdDiff {
  QueryOpts q;
  std::string file;
  bool staged = false;
};
struct CmdFiles {
  QueryOpts q;
  bool json = false;
};
struct CmdRepos {
  QueryOpts q;
};

struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdStatus, CmdNumstat, CmdDiff, CmdFiles, CmdRepos,
                             CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  GlobalOpts global;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace gitscope
