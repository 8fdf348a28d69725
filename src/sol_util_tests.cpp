#include "sol_util.h"

#include "doctest.h"

#include <stdexcept>
#include <string>
#include <vector>

TEST_CASE("sol_util_make_lua_state opens the libraries scripts rely on") {
  auto lua{ luapack::sol_util_make_lua_state() };
  REQUIRE(lua);

  lua->script("s = string.upper('lua') .. tostring(math.floor(2.5))");
  CHECK((*lua)["s"].get<std::string>() == "LUA2");

  lua->script("has_io = io ~= nil and os ~= nil and debug ~= nil and utf8 ~= nil");
  CHECK((*lua)["has_io"].get<bool>());

  lua->script("p = type(package.path) == 'string' and type(package.cpath) == 'string'");
  CHECK((*lua)["p"].get<bool>());
}

TEST_CASE("sol_util_get_optional") {
  auto lua{ luapack::sol_util_make_lua_state() };
  lua->script("cfg = { name = 'lpeg', count = 3, flag = false, list = { 'a' } }");
  sol::table cfg{ (*lua)["cfg"] };

  CHECK(luapack::sol_util_get_optional<std::string>(cfg, "name", "cfg") == "lpeg");
  CHECK(luapack::sol_util_get_optional<int>(cfg, "count", "cfg") == 3);
  CHECK(luapack::sol_util_get_optional<bool>(cfg, "flag", "cfg") == false);
  CHECK(luapack::sol_util_get_optional<sol::table>(cfg, "list", "cfg").has_value());
  CHECK_FALSE(luapack::sol_util_get_optional<std::string>(cfg, "missing", "cfg"));

  CHECK_THROWS_WITH_AS(luapack::sol_util_get_optional<std::string>(cfg, "count", "cfg"),
                       "cfg: count must be a string",
                       std::runtime_error);
}

TEST_CASE("sol_util_get_or_default") {
  auto lua{ luapack::sol_util_make_lua_state() };
  lua->script("cfg = { dir = 'vendor', bad = 7 }");
  sol::table cfg{ (*lua)["cfg"] };

  CHECK(luapack::sol_util_get_or_default<std::string>(cfg, "dir", "lib", "cfg") == "vendor");
  CHECK(luapack::sol_util_get_or_default<std::string>(cfg, "other", "lib", "cfg") == "lib");
  CHECK_THROWS_AS(luapack::sol_util_get_or_default<std::string>(cfg, "bad", "lib", "cfg"),
                  std::runtime_error);
}

TEST_CASE("sol_util_get_string_array") {
  auto lua{ luapack::sol_util_make_lua_state() };
  lua->script("cfg = { names = { 'a', 'b' }, empty = {}, mixed = { 'a', 2 }, scalar = 'x' }");
  sol::table cfg{ (*lua)["cfg"] };

  CHECK(luapack::sol_util_get_string_array(cfg, "names", "cfg") ==
        std::vector<std::string>{ "a", "b" });
  CHECK(luapack::sol_util_get_string_array(cfg, "empty", "cfg").empty());
  CHECK(luapack::sol_util_get_string_array(cfg, "absent", "cfg").empty());
  CHECK_THROWS_WITH_AS(luapack::sol_util_get_string_array(cfg, "mixed", "cfg"),
                       "cfg: mixed[2] must be a string",
                       std::runtime_error);
  CHECK_THROWS_WITH_AS(luapack::sol_util_get_string_array(cfg, "scalar", "cfg"),
                       "cfg: scalar must be a table",
                       std::runtime_error);
}
