#include "cli.h"
#include "tui.h"

#include <cstdlib>
#include <exception>
#include <variant>

int main(int argc, char **argv) {
  luapack::tui::init();

  auto args{ luapack::cli_parse(argc, argv) };

  try {
    luapack::tui::configure_trace_outputs(args.trace_outputs);
  } catch (std::exception const &ex) {
    luapack::tui::scope tui_scope{ args.verbosity, args.decorated_logging };
    luapack::tui::error("%s", ex.what());
    return EXIT_FAILURE;
  }

  luapack::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      luapack::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    luapack::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  auto cmd{ std::visit([](auto const &cfg) { return luapack::cmd::create(cfg); },
                       *args.cmd_cfg) };

  try {
    cmd->execute();
  } catch (std::exception const &ex) {
    luapack::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
