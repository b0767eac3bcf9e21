#pragma once

#include "cmd.h"
#include "cmds/cmd_destroy.h"
#include "cmds/cmd_outputs.h"
#include "cmds/cmd_preview.h"
#include "cmds/cmd_provision.h"
#include "cmds/cmd_secrets.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_destroy::cfg,
                                 cmd_outputs::cfg,
                                 cmd_preview::cfg,
                                 cmd_provision::cfg,
                                 cmd_secrets::cfg,
                                 cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  cmd_globals globals;
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

}  // namespace strata
