#include "sol_util.h"

namespace luapack {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::package,
                      sol::lib::coroutine,
                      sol::lib::string,
                      sol::lib::os,
                      sol::lib::math,
                      sol::lib::table,
                      sol::lib::debug,
                      sol::lib::utf8,
                      sol::lib::io);
  return lua;
}

std::vector<std::string> sol_util_get_string_array(sol::table const &table,
                                                   std::string_view key,
                                                   std::string_view context) {
  std::vector<std::string> result;

  auto const array{ sol_util_get_optional<sol::table>(table, key, context) };
  if (!array) { return result; }

  for (size_t i{ 1 }, n{ array->size() }; i <= n; ++i) {
    sol::object const item{ (*array)[i] };
    if (!item.is<std::string>()) {
      throw std::runtime_error(std::string(context) + ": " + std::string(key) + "[" +
                               std::to_string(i) + "] must be a string");
    }
    result.push_back(item.as<std::string>());
  }

  return result;
}

}  // namespace luapack
