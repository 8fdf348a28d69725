#include "runner.h"

#include "tui.h"

#include <stdexcept>
#include <utility>

namespace luapack {

runner::runner(pack_cfg cfg, lua_State *L)
    : runner{ cfg,
              L,
              unit_index::build(unit_index_search_templates(L)),
              {},
              "/proc" } {
  builtins_ = unit_index_builtin_set(index_, cfg_.builtin_reference, cfg_.site_dir);
}

runner::runner(pack_cfg cfg,
               lua_State *L,
               unit_index index,
               std::set<std::string> builtins,
               std::filesystem::path proc_root)
    : cfg_{ std::move(cfg) },
      L_{ L },
      index_{ std::move(index) },
      builtins_{ std::move(builtins) },
      proc_root_{ std::move(proc_root) },
      pid_{ platform::current_pid() } {
  if (!L_) { throw std::invalid_argument("runner: null Lua state"); }
  tui::debug("runner ready: %zu units, %zu built-in", index_.size(), builtins_.size());
}

void runner::start() {
  if (tracer_) { throw std::logic_error("runner::start: runner already started"); }

  baseline_ = open_handles_snapshot(pid_, "baseline", proc_root_);
  tracer_ = std::make_unique<exec_tracer>(L_, "runner");
  tracer_->start();
}

void runner::stop() {
  if (!tracer_) { throw std::logic_error("runner::stop: runner not started"); }

  tracer_->stop();
  final_ = open_handles_snapshot(pid_, "final", proc_root_);
}

void runner::monitor(std::function<void()> const &fn) {
  start();
  try {
    fn();
  } catch (...) {
    stop();
    throw;
  }
  stop();
}

std::vector<bundle_entry> runner::build_list() {
  if (!tracer_ || tracer_->current_state() != exec_tracer::state::STOPPED) {
    throw std::logic_error("runner::build_list: run has not completed");
  }

  auto const touched{ materializer_collect(tracer_->executed_files(),
                                           open_handles_diff(baseline_, final_)) };

  classifier_cfg const ccfg{ cfg_.classifier() };
  auto entries{ materializer_build_list(touched, [&](std::filesystem::path const &p) {
    return classify(p, index_, builtins_, ccfg);
  }) };

  ledger_.clear();
  for (auto const &entry : entries) {
    if (entry.unit) { ledger_[*entry.unit] += util_path_size(entry.source); }
  }

  tui::debug("%zu files touched, %zu retained", touched.size(), entries.size());
  return entries;
}

void runner::materialize(std::vector<bundle_entry> const &entries) const {
  materialize(entries, cfg_.output);
}

void runner::materialize(std::vector<bundle_entry> const &entries,
                         std::string const &output_root) const {
  ::luapack::materialize(entries, output_root);
}

}  // namespace luapack
