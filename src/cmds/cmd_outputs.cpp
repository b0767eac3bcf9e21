#include "cmd_outputs.h"

#include "cmd_common.h"
#include "orchestrator.h"
#include "tui.h"

namespace strata {

cmd_outputs::cmd_outputs(cfg cfg, cmd_globals globals)
    : cfg_{ std::move(cfg) }, globals_{ std::move(globals) } {}

bool cmd_outputs::execute() {
  orchestrator orch;
  orch.init(cmd_make_init_params(globals_));

  provision_params const params{ cfg_.stacks, {}, cfg_.stacks_dir };
  for (auto const &out : orch.outputs(params)) {
    tui::print_stdout("%s (%s)\n", out.stack.c_str(), out.provider.c_str());
    if (out.state.resources.empty()) { tui::print_stdout("  (no resources)\n"); }
    for (auto const &r : out.state.resources) {
      tui::print_stdout("  %s %s\n", r.key().c_str(), r.fingerprint.c_str());
    }
  }
  return true;
}

}  // namespace strata
