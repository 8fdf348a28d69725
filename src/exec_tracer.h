#pragma once

#include "util.h"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

struct lua_State;

namespace luapack {

class exec_tracer;

// Installs the call hook on construction and removes it on destruction. At most one
// guard may be attached to a Lua state at a time.
class lua_hook_guard : unmovable {
 public:
  lua_hook_guard(lua_State *L, exec_tracer *tracer);
  ~lua_hook_guard();

 private:
  lua_State *L_;
};

// Records the source file of every function the Lua state calls while recording.
// idle -> recording -> stopped; a stopped tracer cannot record again.
class exec_tracer : unmovable {
 public:
  enum class state { IDLE, RECORDING, STOPPED };

  // `label` names the monitored program in trace events.
  exec_tracer(lua_State *L, std::string label);
  ~exec_tracer();

  void start();
  void stop();

  state current_state() const { return state_; }

  // Sorted, deduplicated paths of the files whose code executed. Relative chunk names
  // are returned as recorded.
  std::vector<std::filesystem::path> executed_files() const;

  // Raw hook entry point; appends when the executing source differs from the last one.
  void record(char const *source);

 private:
  lua_State *L_;
  std::string label_;
  state state_{ state::IDLE };
  std::unique_ptr<lua_hook_guard> hook_;
  std::vector<std::string> accumulator_;
  char const *last_source_{ nullptr };
};

}  // namespace luapack
