#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <gitscope/status_parser.hpp>

using namespace gitscope;

TEST_CASE("ordinary change record") {
  auto s = parse_status(
      "1 .M N... 100644 100644 100644 aaaaaaa aaaaaaa src/app.ts");
  REQUIRE(s.files.size() == 1);
  const auto &r = s.files[0];
  CHECK(r.kind == ChangeKind::Ordinary);
  CHECK(r.index == '.');
  CHECK(r.worktree == 'M');
  CHECK(r.path == "src/app.ts");
  CHECK(file_status_from_char(r.worktree) == FileStatus::Modified);
}

TEST_CASE("path with spaces is kept whole") {
  auto s = parse_status(
      "1 M. N... 100644 100644 100644 0123abc 0123abd dir/my file.txt");
  REQUIRE(s.files.size() == 1);
  CHECK(s.files[0].path == "dir/my file.txt");
}

TEST_CASE("branch pragmas") {
  auto s = parse_status("# branch.oid 1234abcd\n"
                        "# branch.head feature/x\n"
                        "# branch.upstream origin/feature/x\n"
                        "# branch.ab +2 -3\n");
  CHECK(s.branch.oid == std::optional<std::string>("1234abcd"));
  CHECK(s.branch.head == std::optional<std::string>("feature/x"));
  CHECK(s.branch.upstream == std::optional<std::string>("origin/feature/x"));
  CHECK(s.branch.ahead == std::optional<long>(2));
  CHECK(s.branch.behind == std::optional<long>(3));
  CHECK(current_branch(s) == std::optional<std::string>("feature/x"));
}

TEST_CASE("detached and unborn heads have no current branch") {
  CHECK_FALSE(current_branch(parse_status("# branch.head (detached)")));
  CHECK_FALSE(current_branch(parse_status("# branch.head (initial)")));
  CHECK_FALSE(current_branch(parse_status("")));
}

TEST_CASE("rename, unmerged, untracked and ignored records") {
  auto s = parse_status(
      "2 R. N... 100644 100644 100644 1234567 1234567 R100 src/new.ts\tsrc/old.ts\n"
      "2 .C N... 100644 100644 100644 1234567 1234567 C75 copy.ts\torig.ts\n"
      "u UU N... 100644 100644 100644 100644 1111111 2222222 3333333 conflict.txt\n"
      "? notes/todo.md\n"
      "? build/\n"
      "! ignored.log\n");

  REQUIRE(s.files.size() == 3);
  CHECK(s.files[0].kind == ChangeKind::RenameOrCopy);
  CHECK(s.files[0].index == 'R');
  CHECK(s.files[0].path == "src/new.ts");
  CHECK(s.files[0].orig_path == std::optional<std::string>("src/old.ts"));
  CHECK(s.files[0].rename_mark == 'R');
  CHECK(s.files[0].score == 100);

  CHECK(s.files[1].rename_mark == 'C');
  CHECK(s.files[1].score == 75);
  CHECK(s.files[1].worktree == 'C');

  CHECK(s.files[2].kind == ChangeKind::Unmerged);
  CHECK(s.files[2].path == "conflict.txt");
  CHECK(file_status_from_char(s.files[2].index) == FileStatus::Conflicted);

  REQUIRE(s.not_added.size() == 2);
  CHECK(s.not_added[0] == "notes/todo.md");
  CHECK(s.not_added[1] == "build/");
  REQUIRE(s.ignored.size() == 1);
  CHECK(s.ignored[0] == "ignored.log");
}

TEST_CASE("malformed lines are skipped without aborting the parse") {
  auto s = parse_status(
      "1 .M broken\n"
      "1 .M N... 10064 100644 100644 aaaaaaa aaaaaaa short-mode.txt\n"
      "2 R. N... 100644 100644 100644 abc abc R100 no-tab\n"
      "2 R. N... 100644 100644 100644 abc abc X100 a\tb\n"
      "u UU N... 100644 100644 100644 100644 zz 2222222 3333333 bad-hash\n"
      "# branch.ab +x -1\n"
      "? \n"
      "garbage\n"
      "1 A. N... 000000 100644 100644 0000000 1234567 ok.txt\n");
  REQUIRE(s.files.size() == 1);
  CHECK(s.files[0].path == "ok.txt");
  CHECK(s.files[0].index == 'A');
  CHECK_FALSE(s.branch.ahead.has_value());
  CHECK(s.not_added.empty());
}

TEST_CASE("status character table") {
  CHECK(file_status_from_char('M') == FileStatus::Modified);
  CHECK(file_status_from_char('A') == FileStatus::Added);
  CHECK(file_status_from_char('D') == FileStatus::Deleted);
  CHECK(file_status_from_char('R') == FileStatus::Renamed);
  CHECK(file_status_from_char('C') == FileStatus::Renamed);
  CHECK(file_status_from_char('U') == FileStatus::Conflicted);
  CHECK(file_status_from_char('T') == FileStatus::Modified);
  CHECK(std::string(to_string(FileStatus::Untracked)) == "untracked");
}
