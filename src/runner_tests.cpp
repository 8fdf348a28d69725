#include "runner.h"

#include "script_host.h"
#include "sol_util.h"
#include "test_support.h"

#include "doctest.h"
#include "lua.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

// tree/
//   base/ref.lua          built-in reference
//   base/std/init.lua     built-in
//   base/site/pkg/...     third-party
//   app/main.lua          monitored script
struct project {
  luapack::test::temp_dir tmp{ "runner" };
  luapack::sol_state_ptr lua{ luapack::sol_util_make_lua_state() };

  project() {
    luapack::test::write_file(tmp / "base/ref.lua", "return {}\n");
    luapack::test::write_file(tmp / "base/std/init.lua", "return { ok = true }\n");
    luapack::test::write_file(tmp / "base/site/pkg/init.lua",
                              "local helper = require('pkg.helper')\n"
                              "return { value = helper.value }\n");
    luapack::test::write_file(tmp / "base/site/pkg/helper.lua", "return { value = 7 }\n");
    luapack::test::write_file(tmp / "base/site/pkg/data.txt", "payload");
    luapack::test::write_file(tmp / "base/site/idle/init.lua", "return {}\n");

    std::string const base{ (tmp / "base").string() };
    std::string const site{ (tmp / "base/site").string() };
    (*lua)["package"]["path"] = site + "/?.lua;" + site + "/?/init.lua;" + base +
                                "/?.lua;" + base + "/?/init.lua";
    (*lua)["package"]["cpath"] = "";
  }

  void write_main(std::string const &body) const {
    luapack::test::write_file(tmp / "app/main.lua", body);
  }

  luapack::pack_cfg cfg() const {
    luapack::pack_cfg c;
    c.builtin_reference = "ref";
    c.output = (tmp / "out").string();
    return c;
  }

  void run_main(luapack::runner &r) const {
    r.monitor([&] { luapack::script_host_run(lua->lua_state(), tmp / "app/main.lua", {}); });
  }
};

std::vector<fs::path> destinations(std::vector<luapack::bundle_entry> const &entries) {
  std::vector<fs::path> result;
  for (auto const &e : entries) { result.push_back(e.destination); }
  return result;
}

bool has(std::vector<fs::path> const &v, fs::path const &p) {
  return std::find(v.begin(), v.end(), p) != v.end();
}

}  // namespace

TEST_CASE("runner builds its index and built-in set from the Lua state") {
  project p;
  luapack::runner r{ p.cfg(), p.lua->lua_state() };

  CHECK(r.index().find("pkg"));
  CHECK(r.index().find("std"));
  CHECK(r.index().find("ref"));
  CHECK(r.builtins() == std::set<std::string>{ "ref", "std" });
  for (auto const &name : r.builtins()) { CHECK(r.index().find(name)); }
}

TEST_CASE("runner refuses a missing built-in reference") {
  project p;
  auto cfg{ p.cfg() };
  cfg.builtin_reference = "not_installed";
  CHECK_THROWS_AS(luapack::runner(cfg, p.lua->lua_state()), std::runtime_error);
}

TEST_CASE("runner bundles the third-party modules a script uses") {
  project p;
  p.write_main("local pkg = require('pkg')\n"
               "local std = require('std')\n"
               "assert(pkg.value == 7 and std.ok)\n"
               "local init = package.searchpath('pkg', package.path)\n"
               "DATA = assert(io.open((init:gsub('init%.lua$', 'data.txt'))))\n");

  luapack::runner r{ p.cfg(), p.lua->lua_state() };
  p.run_main(r);
  auto const list{ r.build_list() };
  auto const dests{ destinations(list) };

  CHECK(has(dests, "pkg/init.lua"));
  CHECK(has(dests, "pkg/helper.lua"));
  CHECK(has(dests, "pkg/data.txt"));
  CHECK(has(dests, "lib/main.lua"));
  CHECK_FALSE(has(dests, "idle/init.lua"));
  for (auto const &e : list) {
    CHECK(e.unit != "std");
    CHECK(e.unit != "ref");
  }

  REQUIRE(r.ledger().contains("pkg"));
  CHECK(r.ledger().at("pkg") > 0);
  CHECK_FALSE(r.ledger().contains("std"));

  r.materialize(list);
  CHECK(fs::exists(p.tmp / "out/pkg/init.lua"));
  CHECK(fs::exists(p.tmp / "out/pkg/helper.lua"));
  CHECK(fs::exists(p.tmp / "out/lib/main.lua"));
  CHECK_FALSE(fs::exists(p.tmp / "out/std"));
}

TEST_CASE("runner honors the unit blacklist") {
  project p;
  p.write_main("require('pkg')\n");

  auto cfg{ p.cfg() };
  cfg.unit_blacklist = { "pkg" };
  luapack::runner r{ cfg, p.lua->lua_state() };
  p.run_main(r);

  CHECK_FALSE(has(destinations(r.build_list()), "pkg/init.lua"));
  CHECK(r.ledger().empty());
}

TEST_CASE("runner::monitor stops recording when the script fails") {
  project p;
  p.write_main("require('pkg')\nerror('boom')\n");

  luapack::runner r{ p.cfg(), p.lua->lua_state() };
  CHECK_THROWS_AS(p.run_main(r), std::runtime_error);
  CHECK(lua_gethook(p.lua->lua_state()) == nullptr);

  CHECK(has(destinations(r.build_list()), "pkg/init.lua"));
}

TEST_CASE("runner state machine") {
  project p;
  luapack::runner r{ p.cfg(),
                     p.lua->lua_state(),
                     luapack::unit_index{},
                     {},
                     p.tmp.path() };

  CHECK_THROWS_AS(r.stop(), std::logic_error);
  CHECK_THROWS_AS(r.build_list(), std::logic_error);

  r.start();
  CHECK_THROWS_AS(r.start(), std::logic_error);
  CHECK_THROWS_AS(r.build_list(), std::logic_error);
  r.stop();

  CHECK(r.build_list().empty());
}
