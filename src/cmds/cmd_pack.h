#pragma once

#include "cmd.h"
#include "cmd_common.h"

#include <functional>

namespace CLI { class App; }

namespace luapack {

// Run a script under the tracer and copy its third-party dependencies into a bundle.
class cmd_pack : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_pack> {
    script_run_opts run;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_pack(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace luapack
