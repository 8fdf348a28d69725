#include "script_host.h"

#include "sol_util.h"
#include "test_support.h"

#include "doctest.h"

#include <stdexcept>
#include <string>

TEST_CASE("script_host_set_args builds the arg table") {
  auto lua{ luapack::sol_util_make_lua_state() };
  luapack::script_host_set_args(lua->lua_state(), "/srv/app/main.lua", { "one", "two" });

  sol::table arg{ (*lua)["arg"] };
  CHECK(arg.get<std::string>(0) == "/srv/app/main.lua");
  CHECK(arg.get<std::string>(1) == "one");
  CHECK(arg.get<std::string>(2) == "two");
  CHECK(arg.size() == 2);
}

TEST_CASE("script_host_run executes the script with its arguments") {
  luapack::test::temp_dir tmp{ "script-host" };
  luapack::test::write_file(tmp / "main.lua",
                            "RESULT = #arg .. ':' .. arg[1] .. ':' .. select('#', ...)\n"
                            "SOURCE = debug.getinfo(1, 'S').source\n");

  auto lua{ luapack::sol_util_make_lua_state() };
  luapack::script_host_run(lua->lua_state(), tmp / "main.lua", { "first" });

  CHECK((*lua)["RESULT"].get<std::string>() == "1:first:0");
  CHECK((*lua)["SOURCE"].get<std::string>() == "@" + (tmp / "main.lua").string());
}

TEST_CASE("script_host_run reports failures") {
  luapack::test::temp_dir tmp{ "script-host-err" };
  auto lua{ luapack::sol_util_make_lua_state() };

  SUBCASE("missing script") {
    CHECK_THROWS_AS(luapack::script_host_run(lua->lua_state(), tmp / "absent.lua", {}),
                    std::runtime_error);
  }

  SUBCASE("runtime error carries the Lua message") {
    luapack::test::write_file(tmp / "boom.lua", "error('kaboom')\n");
    try {
      luapack::script_host_run(lua->lua_state(), tmp / "boom.lua", {});
      FAIL("expected script failure");
    } catch (std::runtime_error const &e) {
      std::string const what{ e.what() };
      CHECK(what.find("script failed") != std::string::npos);
      CHECK(what.find("kaboom") != std::string::npos);
    }
  }

  SUBCASE("syntax error") {
    luapack::test::write_file(tmp / "bad.lua", "local = \n");
    CHECK_THROWS_AS(luapack::script_host_run(lua->lua_state(), tmp / "bad.lua", {}),
                    std::runtime_error);
  }
}
