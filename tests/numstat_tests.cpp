#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <gitscope/numstat.hpp>

using namespace gitscope;

TEST_CASE("numstat text and binary lines") {
  auto st = parse_numstat_line("2\t1\tsrc/app.ts");
  REQUIRE(st);
  CHECK(st->path == "src/app.ts");
  CHECK(st->insertions == 2);
  CHECK(st->deletions == 1);
  CHECK(st->changes == 3);
  CHECK_FALSE(st->binary);

  auto bin = parse_numstat_line("-\t-\tbin/file");
  REQUIRE(bin);
  CHECK(bin->path == "bin/file");
  CHECK(bin->binary);
  CHECK(bin->insertions == 0);
  CHECK(bin->deletions == 0);
  CHECK(bin->changes == 0);
}

TEST_CASE("malformed numstat lines are rejected") {
  CHECK_FALSE(parse_numstat_line("no tabs here"));
  CHECK_FALSE(parse_numstat_line("1\tmissing-path-column"));
  CHECK_FALSE(parse_numstat_line("x\t1\tfile"));
  CHECK_FALSE(parse_numstat_line("1\t-2\tfile"));
}

TEST_CASE("numstat summary totals") {
  auto sum = parse_numstat("\n2\t1\tsrc/app.ts\n-\t-\tbin/file\n"
                           "garbage\n10\t0\tREADME.md\n\n");
  REQUIRE(sum.files.size() == 3);
  CHECK(sum.insertions == 12);
  CHECK(sum.deletions == 1);
  CHECK(sum.changes == 13);
  CHECK(sum.changed == 3);
  CHECK(sum.files[1].binary);

  auto empty = parse_numstat("   \n");
  CHECK(empty.files.empty());
  CHECK(empty.changed == 0);
}

TEST_CASE("rename notations are normalized") {
  auto braces = normalize_numstat_path("src/{old.txt => new.txt}");
  CHECK(braces.new_path == "src/new.txt");
  CHECK(braces.old_path == std::optional<std::string>("src/old.txt"));

  auto mid = normalize_numstat_path("lib/{a => b}/index.ts");
  CHECK(mid.new_path == "lib/b/index.ts");
  CHECK(mid.old_path == std::optional<std::string>("lib/a/index.ts"));

  auto moved_in = normalize_numstat_path("dir/{ => sub}/f.txt");
  CHECK(moved_in.new_path == "dir/sub/f.txt");
  CHECK(moved_in.old_path == std::optional<std::string>("dir/f.txt"));

  auto arrow = normalize_numstat_path("old name.txt => new name.txt");
  CHECK(arrow.new_path == "new name.txt");
  CHECK(arrow.old_path == std::optional<std::string>("old name.txt"));

  auto plain = normalize_numstat_path("  src/plain.ts ");
  CHECK(plain.new_path == "src/plain.ts");
  CHECK_FALSE(plain.old_path);

  auto dangling = normalize_numstat_path("weird =>");
  CHECK(dangling.new_path == "weird =>");
  CHECK_FALSE(dangling.old_path);
}

TEST_CASE("stats map is reachable through every rename spelling") {
  auto sum = parse_numstat("3\t4\tsrc/{old.txt => new.txt}\n1\t0\tplain.ts\n");
  auto map = make_stats_map(sum);

  REQUIRE(map.count("src/{old.txt => new.txt}") == 1);
  REQUIRE(map.count("src/new.txt") == 1);
  REQUIRE(map.count("src/old.txt") == 1);
  CHECK(map["src/new.txt"].added == 3);
  CHECK(map["src/new.txt"].removed == 4);
  CHECK(map["src/old.txt"].added == 3);
  CHECK(map["plain.ts"].added == 1);
  CHECK(map.size() == 4);
}
