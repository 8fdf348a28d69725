#pragma once

#include "cmds/cmd_list.h"
#include "cmds/cmd_pack.h"
#include "cmds/cmd_units.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace luapack {

struct cli_args {
  using cmd_cfg_t =
      std::variant<cmd_pack::cfg, cmd_list::cfg, cmd_units::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace luapack
