#pragma once

#include "exec_tracer.h"
#include "materializer.h"
#include "open_handles.h"
#include "pack_cfg.h"
#include "platform.h"
#include "unit_index.h"
#include "util.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

struct lua_State;

namespace luapack {

// Bytes retained per unit name. Reporting only.
using size_ledger_t = std::map<std::string, std::uint64_t>;

// Owns one unit index, built-in set, tracer and open-handle snapshot pair for a single
// monitored run inside the Lua state `L`.
class runner : unmovable {
 public:
  // Builds the index from L's package.path / package.cpath and derives the built-in
  // set. Throws if the configured built-in reference unit is not installed.
  runner(pack_cfg cfg, lua_State *L);

  runner(pack_cfg cfg,
         lua_State *L,
         unit_index index,
         std::set<std::string> builtins,
         std::filesystem::path proc_root = "/proc");

  void start();
  void stop();

  // start(), fn(), stop(); stop() runs even if fn throws.
  void monitor(std::function<void()> const &fn);

  // Classified, deduplicated bundle entries of the completed run. Refreshes the ledger.
  std::vector<bundle_entry> build_list();

  void materialize(std::vector<bundle_entry> const &entries) const;
  void materialize(std::vector<bundle_entry> const &entries,
                   std::string const &output_root) const;

  size_ledger_t const &ledger() const { return ledger_; }
  unit_index const &index() const { return index_; }
  std::set<std::string> const &builtins() const { return builtins_; }
  pack_cfg const &cfg() const { return cfg_; }

 private:
  pack_cfg cfg_;
  lua_State *L_;
  unit_index index_;
  std::set<std::string> builtins_;
  std::filesystem::path proc_root_;
  platform::process_id pid_;

  std::unique_ptr<exec_tracer> tracer_;
  path_set_t baseline_;
  path_set_t final_;
  size_ledger_t ledger_;
};

}  // namespace luapack
