#include "script_host.h"

#include "trace.h"
#include "tui.h"

#include "sol/sol.hpp"

#include <stdexcept>

namespace luapack {

void script_host_set_args(lua_State *L,
                          std::filesystem::path const &script,
                          std::vector<std::string> const &args) {
  sol::state_view lua{ L };
  sol::table arg{ lua.create_table(static_cast<int>(args.size()), 1) };
  arg[0] = script.string();
  for (std::size_t i{ 0 }; i < args.size(); ++i) { arg[i + 1] = args[i]; }
  lua["arg"] = arg;
}

void script_host_run(lua_State *L,
                     std::filesystem::path const &script,
                     std::vector<std::string> const &args) {
  if (!std::filesystem::is_regular_file(script)) {
    throw std::runtime_error("script not found: " + script.string());
  }

  script_host_set_args(L, script, args);

  run_trace_scope trace_scope{ script.string() };
  tui::debug("running %s with %zu arguments", script.c_str(), args.size());

  sol::state_view lua{ L };
  if (sol::protected_function_result const result{
          lua.safe_script_file(script.string(), sol::script_pass_on_error) };
      !result.valid()) {
    sol::error err = result;
    throw std::runtime_error(std::string("script failed: ") + err.what());
  }

  trace_scope.succeed();
}

}  // namespace luapack
