#include "exec_tracer.h"

#include "trace.h"
#include "tui.h"

#include "lua.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace luapack {

namespace {

// Address used as the registry key for the active tracer.
char const kTracerRegistryKey{ 0 };

void call_hook(lua_State *L, lua_Debug *ar) {
  if (ar->event != LUA_HOOKCALL && ar->event != LUA_HOOKTAILCALL) { return; }

  lua_rawgetp(L, LUA_REGISTRYINDEX, &kTracerRegistryKey);
  auto *const tracer{ static_cast<exec_tracer *>(lua_touserdata(L, -1)) };
  lua_pop(L, 1);
  if (!tracer) { return; }

  if (lua_getinfo(L, "S", ar) == 0) { return; }
  tracer->record(ar->source);
}

}  // namespace

lua_hook_guard::lua_hook_guard(lua_State *L, exec_tracer *tracer) : L_{ L } {
  lua_rawgetp(L_, LUA_REGISTRYINDEX, &kTracerRegistryKey);
  bool const occupied{ !lua_isnil(L_, -1) };
  lua_pop(L_, 1);
  if (occupied) {
    throw std::logic_error("a tracer is already attached to this Lua state");
  }

  lua_pushlightuserdata(L_, tracer);
  lua_rawsetp(L_, LUA_REGISTRYINDEX, &kTracerRegistryKey);
  lua_sethook(L_, call_hook, LUA_MASKCALL, 0);
}

lua_hook_guard::~lua_hook_guard() {
  lua_sethook(L_, nullptr, 0, 0);
  lua_pushnil(L_);
  lua_rawsetp(L_, LUA_REGISTRYINDEX, &kTracerRegistryKey);
}

exec_tracer::exec_tracer(lua_State *L, std::string label)
    : L_{ L }, label_{ std::move(label) } {
  if (!L_) { throw std::invalid_argument("exec_tracer: null Lua state"); }
}

exec_tracer::~exec_tracer() = default;

void exec_tracer::start() {
  if (state_ != state::IDLE) {
    throw std::logic_error("exec_tracer::start: tracer already used; create a new one");
  }

  accumulator_.reserve(256);
  hook_ = std::make_unique<lua_hook_guard>(L_, this);
  state_ = state::RECORDING;
  tui::debug("execution hook installed for %s", label_.c_str());
  LUAPACK_TRACE_HOOK_INSTALLED(label_);
}

void exec_tracer::stop() {
  if (state_ != state::RECORDING) {
    throw std::logic_error("exec_tracer::stop: tracer is not recording");
  }

  hook_.reset();
  last_source_ = nullptr;
  state_ = state::STOPPED;
  tui::debug("execution hook removed after %zu source switches", accumulator_.size());
  LUAPACK_TRACE_HOOK_REMOVED(label_, static_cast<std::int64_t>(accumulator_.size()));
}

void exec_tracer::record(char const *source) {
  if (source == last_source_ || source == nullptr) { return; }
  last_source_ = source;

  // "@path" names a file chunk; "=name" and literal source strings are not files.
  if (source[0] != '@') { return; }
  if (!accumulator_.empty() && accumulator_.back() == source + 1) { return; }
  accumulator_.emplace_back(source + 1);
}

std::vector<std::filesystem::path> exec_tracer::executed_files() const {
  std::vector<std::string> unique{ accumulator_ };
  std::sort(unique.begin(), unique.end());
  unique.erase(std::unique(unique.begin(), unique.end()), unique.end());

  return { unique.begin(), unique.end() };
}

}  // namespace luapack
