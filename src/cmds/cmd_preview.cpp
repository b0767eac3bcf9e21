#include "cmd_preview.h"

#include "cmd_common.h"
#include "orchestrator.h"

namespace strata {

cmd_preview::cmd_preview(cfg cfg, cmd_globals globals)
    : cfg_{ std::move(cfg) }, globals_{ std::move(globals) } {}

bool cmd_preview::execute() {
  orchestrator orch;
  orch.init(cmd_make_init_params(globals_));

  provision_params const params{ cfg_.stacks,
                                 provision_flags{ cfg_.skip_refresh, false },
                                 cfg_.stacks_dir };
  cmd_print_previews(orch.preview_provision(params));
  return true;
}

}  // namespace strata
