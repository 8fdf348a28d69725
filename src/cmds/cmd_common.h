#pragma once

#include "pack_cfg.h"
#include "runner.h"
#include "sol_util.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CLI { class App; }

namespace luapack {

// Options shared by the commands that run a script under the tracer.
struct script_run_opts {
  std::filesystem::path script;
  std::vector<std::string> script_args;
  std::optional<std::filesystem::path> config_path;
  pack_overrides overrides;
};

void register_script_run_opts(CLI::App &sub, script_run_opts &opts);

// Lua state, runner and bundle list of one traced script run. The state outlives the
// runner that hooks it.
struct traced_run {
  sol_state_ptr lua;
  std::unique_ptr<runner> run;
  std::vector<bundle_entry> entries;
};

traced_run run_traced_script(script_run_opts const &opts);

void print_ledger(size_ledger_t const &ledger);

}  // namespace luapack
