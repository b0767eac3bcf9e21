#include "cmd_destroy.h"

#include "cmd_common.h"
#include "orchestrator.h"
#include "termination.h"
#include "tui.h"

#include <algorithm>
#include <memory>

namespace strata {

cmd_destroy::cmd_destroy(cfg cfg, cmd_globals globals)
    : cfg_{ std::move(cfg) }, globals_{ std::move(globals) } {}

bool cmd_destroy::execute() {
  orchestrator orch;
  orch.init(cmd_make_init_params(globals_, cfg_.jobs));

  provision_params const params{ cfg_.stacks,
                                 provision_flags{ cfg_.skip_refresh, cfg_.skip_preview },
                                 cfg_.stacks_dir };

  auto const token{ std::make_shared<cancellation_token>() };
  termination_scope const interrupt{ token };

  provision_options options{};
  options.token = token;
  options.confirm = [yes = cfg_.yes](std::vector<preview_result> const &previews) {
    cmd_print_previews(previews);
    bool const any_changes{ std::any_of(previews.begin(),
                                        previews.end(),
                                        [](auto const &p) { return p.has_changes(); }) };
    if (!any_changes || yes) { return true; }
    if (cmd_prompt_yes_no("Destroy these resources?")) { return true; }
    tui::warn("Destroy declined; nothing was removed (pass --yes to skip the prompt)");
    return false;
  };

  auto const report{ orch.destroy(params, options) };
  cmd_print_report(report);
  return report.ok();
}

}  // namespace strata
