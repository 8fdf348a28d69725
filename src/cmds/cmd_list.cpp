#include "cmd_list.h"

#include "tui.h"

#include "CLI11.hpp"

#include <memory>
#include <utility>

namespace luapack {

void cmd_list::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("list", "Run a script and print what would be bundled") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  register_script_run_opts(*sub, cfg_ptr->run);
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_list::cmd_list(cmd_list::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_list::execute() {
  auto const traced{ run_traced_script(cfg_.run) };

  for (auto const &entry : traced.entries) {
    tui::print_stdout("%s -> %s\n", entry.source.c_str(), entry.destination.c_str());
  }
  print_ledger(traced.run->ledger());
}

}  // namespace luapack
