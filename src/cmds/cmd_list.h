#pragma once

#include "cmd.h"
#include "cmd_common.h"

#include <functional>

namespace CLI { class App; }

namespace luapack {

// Same run as `pack`, printing the bundle plan and per-unit sizes instead of copying.
class cmd_list : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_list> {
    script_run_opts run;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_list(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace luapack
