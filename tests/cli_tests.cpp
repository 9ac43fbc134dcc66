#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <gitscope/app.hpp>
#include <gitscope/cli.hpp>

#include <filesystem>
#include <string>
#include <vector>

using namespace gitscope;
namespace fs = std::filesystem;

static ParseResult parse(std::vector<std::string> args) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &s : args)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);
  return parse_cli(static_cast<int>(args.size()), argv.data());
}

static int run_app(std::vector<std::string> args) {
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &s : args)
    argv.push_back(const_cast<char *>(s.c_str()));
  argv.push_back(nullptr);
  return App{}.run(static_cast<int>(args.size()), argv.data());
}

static fs::path mkd(const char *name) {
  auto d = fs::temp_directory_path() / (std::string("gitscope_cli_") + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

TEST_CASE("no command means help") {
  auto r = parse({"gitscope"});
  REQUIRE(r.cmd);
  CHECK(std::holds_alternative<CmdHelp>(*r.cmd));
  CHECK(r.error.empty());
}

TEST_CASE("status with query options") {
  auto r = parse({"gitscope", "status", "--cwd", "sub", "--timeout-ms", "250"});
  REQUIRE(r.cmd);
  auto *c = std::get_if<CmdStatus>(&*r.cmd);
  REQUIRE(c);
  CHECK(c->q.cwd == std::optional<std::string>("sub"));
  CHECK(c->q.timeout_ms == std::optional<long>(250));
}

TEST_CASE("global options may come before or after the command") {
  auto r = parse({"gitscope", "--root", "/w", "numstat", "--cached", "--workers",
                  "4", "-v"});
  REQUIRE(r.cmd);
  auto *c = std::get_if<CmdNumstat>(&*r.cmd);
  REQUIRE(c);
  CHECK(c->staged);
  CHECK(r.global.root == std::optional<std::string>("/w"));
  CHECK(r.global.workers == std::optional<unsigned>(4));
  CHECK(r.global.verbose);
}

TEST_CASE("diff requires a file") {
  auto ok = parse({"gitscope", "diff", "--staged", "project-a/src/app.ts"});
  REQUIRE(ok.cmd);
  auto *c = std::get_if<CmdDiff>(&*ok.cmd);
  REQUIRE(c);
  CHECK(c->file == "project-a/src/app.ts");
  CHECK(c->staged);

  auto missing = parse({"gitscope", "diff"});
  CHECK_FALSE(missing.cmd);
  CHECK(missing.error == "diff: file path required");
}

TEST_CASE("files and repos commands") {
  auto f = parse({"gitscope", "files", "--json"});
  REQUIRE(f.cmd);
  auto *files = std::get_if<CmdFiles>(&*f.cmd);
  REQUIRE(files);
  CHECK(files->json);

  auto r = parse({"gitscope", "repos", "--cwd", "x"});
  REQUIRE(r.cmd);
  CHECK(std::holds_alternative<CmdRepos>(*r.cmd));

  CHECK(std::holds_alternative<CmdVersion>(*parse({"gitscope", "version"}).cmd));
  CHECK(std::holds_alternative<CmdHelp>(*parse({"gitscope", "status", "-h"}).cmd));
}

TEST_CASE("parse errors") {
  CHECK(parse({"gitscope", "frobnicate"}).error == "unknown command: frobnicate");
  CHECK(parse({"gitscope", "status", "--bogus"}).error == "unknown option: --bogus");
  CHECK(parse({"gitscope", "status", "--timeout-ms", "-5"}).error ==
        "--timeout-ms: expected a non-negative number");
  CHECK(parse({"gitscope", "--workers", "many", "status"}).error ==
        "--workers: expected a non-negative number");
}

TEST_CASE("app exit codes") {
  CHECK(run_app({"gitscope", "help"}) == 0);
  CHECK(run_app({"gitscope", "version"}) == 0);
  CHECK(run_app({"gitscope", "frobnicate"}) == 2);

  auto root = mkd("app");
  fs::create_directories(root / "one" / ".git");
  CHECK(run_app({"gitscope", "--root", root.string(), "repos"}) == 0);
  CHECK(run_app({"gitscope", "--root", root.string(), "diff", "../outside"}) == 1);

  auto empty = mkd("app_empty");
  CHECK(run_app({"gitscope", "--root", empty.string(), "status"}) == 1);

  fs::remove_all(root);
  fs::remove_all(empty);
}
