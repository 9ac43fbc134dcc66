#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <gitscope/discovery.hpp>

#include <filesystem>
#include <fstream>
#include <stdlib.h>
#include <string>

using namespace gitscope;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

static fs::path make_tmpdir(const char *name) {
  std::string tmpl =
      (fs::temp_directory_path() / (std::string("gitscope_disc_") + name + "_XXXXXX"))
          .string();
  REQUIRE(::mkdtemp(tmpl.data()) != nullptr);
  return fs::path(tmpl);
}

static void fake_repo(const fs::path &dir) {
  fs::create_directories(dir / ".git");
}

static std::vector<std::string> rel_paths(const std::vector<DiscoveredRepo> &v) {
  std::vector<std::string> out;
  for (const auto &r : v)
    out.push_back(r.relative_path);
  return out;
}

TEST_CASE("nested repositories are found and not descended into") {
  auto root = make_tmpdir("basic");
  fake_repo(root / "project-a");
  fake_repo(root / "project-a" / "vendor" / "inner");
  fake_repo(root / "libs" / "b");
  fs::create_directories(root / "docs" / "empty");
  {
    // worktree-style .git file
    fs::create_directories(root / "wt");
    std::ofstream o(root / "wt" / ".git");
    o << "gitdir: /elsewhere\n";
  }

  auto repos = discover_nested_repos(root);
  REQUIRE(rel_paths(repos) ==
          std::vector<std::string>{"libs/b", "project-a", "wt"});
  CHECK(repos[1].absolute_path == root / "project-a");

  fs::remove_all(root);
}

TEST_CASE("root itself is never reported") {
  auto root = make_tmpdir("self");
  fake_repo(root);
  fake_repo(root / "child");

  auto repos = discover_nested_repos(root);
  REQUIRE(rel_paths(repos) == std::vector<std::string>{"child"});

  fs::remove_all(root);
}

TEST_CASE("pruned and hidden directories are skipped") {
  auto root = make_tmpdir("prune");
  fake_repo(root / "node_modules" / "pkg");
  fake_repo(root / "build" / "gen");
  fake_repo(root / ".hidden" / "r");
  fake_repo(root / "src" / "ok");

  auto repos = discover_nested_repos(root);
  CHECK(rel_paths(repos) == std::vector<std::string>{"src/ok"});

  CHECK(is_pruned_directory("node_modules"));
  CHECK(is_pruned_directory(".anything"));
  CHECK_FALSE(is_pruned_directory("src"));

  fs::remove_all(root);
}

TEST_CASE("depth limit") {
  auto root = make_tmpdir("depth");
  fake_repo(root / "a" / "b" / "c" / "d");
  fake_repo(root / "a" / "b" / "c" / "d2" / "e");

  CHECK(rel_paths(discover_nested_repos(root)) ==
        std::vector<std::string>{"a/b/c/d"});

  DiscoveryLimits shallow;
  shallow.max_depth = 3;
  CHECK(discover_nested_repos(root, shallow).empty());

  fs::remove_all(root);
}

TEST_CASE("repo and directory limits bound the scan") {
  auto root = make_tmpdir("limits");
  for (const char *n : {"r1", "r2", "r3", "r4"})
    fake_repo(root / n);

  DiscoveryLimits two_repos;
  two_repos.max_repos = 2;
  CHECK(rel_paths(discover_nested_repos(root, two_repos)) ==
        std::vector<std::string>{"r1", "r2"});

  // root + r1 + r2
  DiscoveryLimits three_dirs;
  three_dirs.max_directories = 3;
  CHECK(rel_paths(discover_nested_repos(root, three_dirs)) ==
        std::vector<std::string>{"r1", "r2"});

  fs::remove_all(root);
}

TEST_CASE("symlinked directories are not followed") {
  auto root = make_tmpdir("symlink");
  auto outside = make_tmpdir("symlink_target");
  fake_repo(outside / "far");
  std::error_code ec;
  fs::create_directory_symlink(outside, root / "link", ec);
  REQUIRE_FALSE(ec);

  CHECK(discover_nested_repos(root).empty());

  fs::remove_all(root);
  fs::remove_all(outside);
}

TEST_CASE("missing root yields no repositories") {
  CHECK(discover_nested_repos("/nonexistent/gitscope/root").empty());
}

TEST_CASE("discovery cache honours its ttl") {
  auto t = DiscoveryCache::Clock::time_point{};
  DiscoveryCache cache(3000ms, [&t] { return t; });
  CHECK(cache.ttl() == 3000ms);

  std::vector<DiscoveredRepo> repos{{"/w/a", "a"}};
  cache.put("/w", repos);

  t += 2999ms;
  auto hit = cache.get("/w");
  REQUIRE(hit);
  CHECK(*hit == repos);
  CHECK_FALSE(cache.get("/other"));

  t += 1ms;
  CHECK_FALSE(cache.get("/w"));

  cache.put("/w", repos);
  cache.clear();
  CHECK_FALSE(cache.get("/w"));
}

TEST_CASE("get_or_scan serves cached results until expiry") {
  auto root = make_tmpdir("cache_scan");
  fake_repo(root / "one");

  auto t = DiscoveryCache::Clock::time_point{};
  DiscoveryCache cache(1000ms, [&t] { return t; });
  CHECK(rel_paths(cache.get_or_scan(root, {})) ==
        std::vector<std::string>{"one"});

  fake_repo(root / "two");
  CHECK(rel_paths(cache.get_or_scan(root, {})) ==
        std::vector<std::string>{"one"});

  t += 1000ms;
  CHECK(rel_paths(cache.get_or_scan(root, {})) ==
        std::vector<std::string>{"one", "two"});

  fs::remove_all(root);
}
