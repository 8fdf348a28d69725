#include "pack_cfg.h"

#include "sol_util.h"
#include "tui.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace luapack {

namespace fs = std::filesystem;

namespace {

constexpr char kConfigFilename[]{ "luapack.lua" };

pack_cfg from_state(sol::state &lua, fs::path const &path) {
  std::string const context{ path.filename().string() };
  sol::table globals{ lua.globals() };

  pack_cfg cfg;
  cfg.unit_blacklist = sol_util_get_string_array(globals, "UNIT_BLACKLIST", context);
  cfg.file_blacklist = sol_util_get_string_array(globals, "FILE_BLACKLIST", context);
  cfg.builtin_reference =
      sol_util_get_or_default<std::string>(globals, "BUILTIN_REFERENCE", "", context);
  cfg.site_dir = sol_util_get_or_default<std::string>(globals, "SITE_DIR", cfg.site_dir, context);
  cfg.catch_all =
      sol_util_get_or_default<std::string>(globals, "CATCH_ALL", cfg.catch_all, context);
  cfg.output = sol_util_get_or_default<std::string>(globals, "OUTPUT", cfg.output, context);
  cfg.source = path;

  if (cfg.catch_all.empty()) { throw std::runtime_error(context + ": CATCH_ALL is empty"); }
  if (fs::path{ cfg.catch_all }.is_absolute()) {
    throw std::runtime_error(context + ": CATCH_ALL must be a relative directory");
  }
  for (auto const &component : fs::path{ cfg.catch_all }.lexically_normal()) {
    if (component == "..") {
      throw std::runtime_error(context + ": CATCH_ALL must stay inside the bundle");
    }
  }
  return cfg;
}

}  // namespace

std::optional<fs::path> pack_cfg::discover(fs::path start) {
  auto cur{ fs::absolute(start) };

  for (;;) {
    auto const candidate{ cur / kConfigFilename };
    if (fs::exists(candidate)) { return candidate; }

    auto const git_path{ cur / ".git" };
    if (fs::exists(git_path) && fs::is_directory(git_path)) { return std::nullopt; }

    auto const parent{ cur.parent_path() };
    if (parent == cur) { return std::nullopt; }

    cur = parent;
  }
}

pack_cfg pack_cfg::load(fs::path const &path) {
  tui::debug("Loading config from file: %s", path.string().c_str());

  std::ifstream in{ path, std::ios::binary };
  if (!in) { throw std::runtime_error("cannot read config: " + path.string()); }
  std::ostringstream contents;
  contents << in.rdbuf();

  return load(contents.str().c_str(), path);
}

pack_cfg pack_cfg::load(char const *script, fs::path const &path) {
  auto state{ sol_util_make_lua_state() };

  if (sol::protected_function_result const result{
          state->safe_script(script, sol::script_pass_on_error, "@" + path.string()) };
      !result.valid()) {
    sol::error err = result;
    throw std::runtime_error(std::string("Failed to execute config script: ") + err.what());
  }

  return from_state(*state, path);
}

pack_cfg pack_cfg::resolve(std::optional<fs::path> const &explicit_path) {
  if (explicit_path) {
    auto const path{ fs::absolute(*explicit_path) };
    if (!fs::exists(path)) { throw std::runtime_error("config not found: " + path.string()); }
    return load(path);
  }

  if (auto const discovered{ discover() }) { return load(*discovered); }

  tui::debug("no %s found; using defaults", kConfigFilename);
  return {};
}

classifier_cfg pack_cfg::classifier() const {
  return { .unit_blacklist = unit_blacklist,
           .file_blacklist = file_blacklist,
           .catch_all = catch_all };
}

void pack_cfg_apply(pack_cfg &cfg, pack_overrides const &overrides) {
  if (overrides.output) { cfg.output = *overrides.output; }
  cfg.unit_blacklist.insert(cfg.unit_blacklist.end(),
                            overrides.exclude_units.begin(),
                            overrides.exclude_units.end());
  cfg.file_blacklist.insert(cfg.file_blacklist.end(),
                            overrides.exclude_files.begin(),
                            overrides.exclude_files.end());
}

}  // namespace luapack
