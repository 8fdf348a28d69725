#include "cmd_units.h"

#include "pack_cfg.h"
#include "sol_util.h"
#include "tui.h"
#include "unit_index.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace luapack {

void cmd_units::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("units", "List installed units and their roots") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("--config", cfg_ptr->config_path, "Path to luapack.lua");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_units::cmd_units(cmd_units::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_units::execute() {
  auto const pcfg{ pack_cfg::resolve(cfg_.config_path) };
  auto const lua{ sol_util_make_lua_state() };

  auto const index{ unit_index::build(unit_index_search_templates(lua->lua_state())) };
  auto const builtins{ unit_index_builtin_set(index, pcfg.builtin_reference, pcfg.site_dir) };

  for (auto const &[name, u] : index.units()) {
    tui::print_stdout("%-24s %s%s\n",
                      name.c_str(),
                      u.root.c_str(),
                      builtins.contains(name) ? "  (built-in)" : "");
  }
}

}  // namespace luapack
