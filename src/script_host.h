#pragma once

#include <filesystem>
#include <string>
#include <vector>

struct lua_State;

namespace luapack {

// Populate the global `arg` table the way the stand-alone interpreter does: arg[0] is
// the script, arg[1..n] its arguments.
void script_host_set_args(lua_State *L,
                          std::filesystem::path const &script,
                          std::vector<std::string> const &args);

// Load and run `script` as a file chunk so its source is recorded as "@<path>". Throws
// std::runtime_error carrying the Lua error message.
void script_host_run(lua_State *L,
                     std::filesystem::path const &script,
                     std::vector<std::string> const &args);

}  // namespace luapack
