#include "cmd_common.h"

#include "script_host.h"
#include "tui.h"
#include "util.h"

#include "CLI11.hpp"

#include <stdexcept>
#include <utility>

namespace luapack {

namespace fs = std::filesystem;

void register_script_run_opts(CLI::App &sub, script_run_opts &opts) {
  sub.add_option("script", opts.script, "Lua script to run")
      ->required()
      ->check(CLI::ExistingFile);
  sub.add_option("args", opts.script_args, "Arguments passed to the script (after --)");
  sub.add_option("--config", opts.config_path, "Path to luapack.lua");
  sub.add_option("--output", opts.overrides.output, "Bundle output directory");
  sub.add_option("--exclude-unit", opts.overrides.exclude_units, "Unit to leave out");
  sub.add_option("--exclude-file", opts.overrides.exclude_files, "Filename glob to leave out");
}

traced_run run_traced_script(script_run_opts const &opts) {
  auto cfg{ pack_cfg::resolve(opts.config_path) };
  pack_cfg_apply(cfg, opts.overrides);

  fs::path const script{ fs::canonical(opts.script) };

  traced_run result;
  result.lua = sol_util_make_lua_state();
  lua_State *const L{ result.lua->lua_state() };

  result.run = std::make_unique<runner>(std::move(cfg), L);
  result.run->monitor([&] { script_host_run(L, script, opts.script_args); });
  result.entries = result.run->build_list();
  return result;
}

void print_ledger(size_ledger_t const &ledger) {
  for (auto const &[name, bytes] : ledger) {
    tui::print_stdout("%-24s %s\n", name.c_str(), util_format_bytes(bytes).c_str());
  }
}

}  // namespace luapack
