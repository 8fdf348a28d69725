#include "cmd_pack.h"

#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace luapack {

void cmd_pack::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("pack", "Run a script and bundle the modules it used") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  register_script_run_opts(*sub, cfg_ptr->run);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_pack::cmd_pack(cmd_pack::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_pack::execute() {
  auto const traced{ run_traced_script(cfg_.run) };
  if (traced.entries.empty()) {
    tui::info("nothing to bundle");
    return;
  }

  traced.run->materialize(traced.entries);
  tui::info("bundled %zu entries from %zu units into %s",
            traced.entries.size(),
            traced.run->ledger().size(),
            traced.run->cfg().output.c_str());
}

}  // namespace luapack
