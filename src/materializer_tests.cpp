#include "materializer.h"

#include "test_support.h"

#include "doctest.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::string read_all(fs::path const &p) {
  std::ifstream in{ p, std::ios::binary };
  return { std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
}

luapack::classify_fn_t classifier_for(luapack::unit_index const &index,
                                      std::set<std::string> const &builtins,
                                      luapack::classifier_cfg const &cfg = {}) {
  return [&index, &builtins, cfg](fs::path const &p) {
    return luapack::classify(p, index, builtins, cfg);
  };
}

}  // namespace

TEST_CASE("build_list end to end for a single executed module") {
  luapack::test::temp_dir tmp{ "mat-e2e" };
  luapack::test::write_file(tmp / "a/pkg/mod.lua");

  auto const index{ luapack::unit_index::from_units({ { .name = "pkg", .root = tmp / "a/pkg" } }) };
  std::set<std::string> const builtins;

  auto const touched{ luapack::materializer_collect({ tmp / "a/pkg/mod.lua" }, {}) };
  auto const list{ luapack::materializer_build_list(touched, classifier_for(index, builtins)) };

  REQUIRE(list.size() == 1);
  CHECK(list[0].source == tmp / "a/pkg/mod.lua");
  CHECK(list[0].destination == "pkg/mod.lua");
  CHECK(list[0].unit == "pkg");
}

TEST_CASE("materializer_collect merges origins by canonical path") {
  luapack::test::temp_dir tmp{ "mat-collect" };
  luapack::test::write_file(tmp / "a/pkg/mod.lua");
  fs::create_symlink(tmp / "a/pkg/mod.lua", tmp / "alias.lua");
  fs::create_symlink(tmp / "missing.lua", tmp / "dangling.lua");

  auto const touched{ luapack::materializer_collect(
      { tmp / "a/pkg/mod.lua", tmp / "a/pkg/../pkg/mod.lua", tmp / "dangling.lua" },
      { tmp / "alias.lua", "/dev/null" }) };

  REQUIRE(touched.size() == 1);
  CHECK(touched[0].path == tmp / "a/pkg/mod.lua");
  CHECK(touched[0].origin == (luapack::TOUCH_EXECUTED | luapack::TOUCH_OPENED));
}

TEST_CASE("a file both executed and opened is listed and copied once") {
  luapack::test::temp_dir tmp{ "mat-dedup" };
  luapack::test::write_file(tmp / "a/pkg/mod.lua", "return 1\n");

  auto const index{ luapack::unit_index::from_units({ { .name = "pkg", .root = tmp / "a/pkg" } }) };
  std::set<std::string> const builtins;

  auto const touched{ luapack::materializer_collect({ tmp / "a/pkg/mod.lua" },
                                                    { tmp / "a/pkg/mod.lua" }) };
  auto const list{ luapack::materializer_build_list(touched, classifier_for(index, builtins)) };
  REQUIRE(list.size() == 1);

  luapack::materialize(list, (tmp / "out").string());
  CHECK(read_all(tmp / "out/pkg/mod.lua") == "return 1\n");
}

TEST_CASE("build_list drops excluded files and sorts by destination") {
  luapack::test::temp_dir tmp{ "mat-filter" };
  luapack::test::write_file(tmp / "base/std.lua");
  luapack::test::write_file(tmp / "site/zed/init.lua");
  luapack::test::write_file(tmp / "site/alpha/init.lua");
  luapack::test::write_file(tmp / "site/alpha/key_secret.lua");
  luapack::test::write_file(tmp / "elsewhere/libz.so.1");

  auto const index{ luapack::unit_index::from_units({
      { .name = "std", .root = tmp / "base/std.lua" },
      { .name = "zed", .root = tmp / "site/zed" },
      { .name = "alpha", .root = tmp / "site/alpha" },
  }) };
  std::set<std::string> const builtins{ "std" };
  luapack::classifier_cfg cfg{};
  cfg.file_blacklist = { "*secret*" };

  auto const touched{ luapack::materializer_collect(
      { tmp / "base/std.lua",
        tmp / "site/zed/init.lua",
        tmp / "site/alpha/init.lua",
        tmp / "site/alpha/key_secret.lua" },
      { tmp / "elsewhere/libz.so.1" }) };
  auto const list{ luapack::materializer_build_list(touched,
                                                    classifier_for(index, builtins, cfg)) };

  std::vector<fs::path> destinations;
  for (auto const &e : list) {
    destinations.push_back(e.destination);
    CHECK(e.unit != "std");
  }
  CHECK(destinations ==
        std::vector<fs::path>{ "alpha/init.lua", "lib/libz.so.1", "zed/init.lua" });
}

TEST_CASE("build_list drops files covered by a directory entry") {
  luapack::test::temp_dir tmp{ "mat-cover" };
  luapack::test::write_file(tmp / "a/pkg/data/one.txt");
  luapack::test::write_file(tmp / "a/pkg/init.lua");

  auto const index{ luapack::unit_index::from_units({ { .name = "pkg", .root = tmp / "a/pkg" } }) };
  std::set<std::string> const builtins;

  auto const touched{ luapack::materializer_collect(
      { tmp / "a/pkg/init.lua", tmp / "a/pkg/data/one.txt" },
      { tmp / "a/pkg/data" }) };
  auto const list{ luapack::materializer_build_list(touched, classifier_for(index, builtins)) };

  REQUIRE(list.size() == 2);
  CHECK(list[0].destination == "pkg/data");
  CHECK(list[1].destination == "pkg/init.lua");
}

TEST_CASE("materialize copies files and directories") {
  luapack::test::temp_dir tmp{ "mat-copy" };
  luapack::test::write_file(tmp / "src/pkg/init.lua", "init");
  luapack::test::write_file(tmp / "src/pkg/data/a.txt", "a");
  luapack::test::write_file(tmp / "src/pkg/data/sub/b.txt", "b");
  luapack::test::write_file(tmp / "src/other/libx.so", "elf");

  std::vector<luapack::bundle_entry> const list{
    { .source = tmp / "src/other/libx.so", .destination = "lib/libx.so" },
    { .source = tmp / "src/pkg/data", .destination = "pkg/data", .unit = "pkg" },
    { .source = tmp / "src/pkg/init.lua", .destination = "pkg/init.lua", .unit = "pkg" },
  };

  luapack::materialize(list, (tmp / "out").string());

  CHECK(read_all(tmp / "out/lib/libx.so") == "elf");
  CHECK(read_all(tmp / "out/pkg/init.lua") == "init");
  CHECK(read_all(tmp / "out/pkg/data/a.txt") == "a");
  CHECK(read_all(tmp / "out/pkg/data/sub/b.txt") == "b");
}

TEST_CASE("materialize keeps output roots with spaces and shell characters intact") {
  luapack::test::temp_dir tmp{ "mat-spaces" };
  luapack::test::write_file(tmp / "src/mod.lua", "mod");
  fs::create_directories(tmp / "my");

  std::vector<luapack::bundle_entry> const list{
    { .source = tmp / "src/mod.lua", .destination = "lib/mod.lua" },
  };

  luapack::materialize(list, (tmp / "my bundle").string());
  CHECK(read_all(tmp / "my bundle/lib/mod.lua") == "mod");
  CHECK(fs::is_empty(tmp / "my"));

  luapack::materialize(list, (tmp / "out(1)").string());
  CHECK(read_all(tmp / "out(1)/lib/mod.lua") == "mod");
}

TEST_CASE("unowned files sharing a basename collide in the catch-all directory") {
  luapack::test::temp_dir tmp{ "mat-catchall" };
  luapack::test::write_file(tmp / "cpath/socket/core.so", "socket");
  luapack::test::write_file(tmp / "cpath/mime/core.so", "mime");

  luapack::unit_index const index{};
  std::set<std::string> const builtins;

  auto const touched{ luapack::materializer_collect(
      {}, { tmp / "cpath/socket/core.so", tmp / "cpath/mime/core.so" }) };
  auto const list{ luapack::materializer_build_list(touched, classifier_for(index, builtins)) };

  REQUIRE(list.size() == 2);
  CHECK(list[0].destination == "lib/core.so");
  CHECK(list[1].destination == "lib/core.so");
  CHECK_THROWS_WITH_AS(luapack::materialize(list, (tmp / "out").string()),
                       doctest::Contains("destination collision at lib/core.so"),
                       std::runtime_error);
  CHECK_FALSE(fs::exists(tmp / "out"));
}

TEST_CASE("materialize refuses colliding destinations before copying") {
  luapack::test::temp_dir tmp{ "mat-collide" };
  luapack::test::write_file(tmp / "one/libz.so");
  luapack::test::write_file(tmp / "two/libz.so");

  std::vector<luapack::bundle_entry> const list{
    { .source = tmp / "one/libz.so", .destination = "lib/libz.so" },
    { .source = tmp / "two/libz.so", .destination = "lib/libz.so" },
  };

  CHECK_THROWS_AS(luapack::materializer_check_collisions(list), std::runtime_error);
  CHECK_THROWS_AS(luapack::materialize(list, (tmp / "out").string()), std::runtime_error);
  CHECK_FALSE(fs::exists(tmp / "out"));
}

TEST_CASE("materialize never overwrites and stops at the first failure") {
  luapack::test::temp_dir tmp{ "mat-failfast" };
  luapack::test::write_file(tmp / "src/a.lua", "new");
  luapack::test::write_file(tmp / "src/b.lua", "b");
  luapack::test::write_file(tmp / "out/lib/a.lua", "old");

  std::vector<luapack::bundle_entry> const list{
    { .source = tmp / "src/a.lua", .destination = "lib/a.lua" },
    { .source = tmp / "src/b.lua", .destination = "lib/b.lua" },
  };

  CHECK_THROWS_AS(luapack::materialize(list, (tmp / "out").string()), std::runtime_error);
  CHECK(read_all(tmp / "out/lib/a.lua") == "old");
  CHECK_FALSE(fs::exists(tmp / "out/lib/b.lua"));
}
