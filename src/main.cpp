#include "cli.h"
#include "termination.h"
#include "tui.h"

#include <cstdlib>
#include <variant>

int main(int argc, char **argv) {
  strata::tui::init();

  auto args{ strata::cli_parse(argc, argv) };
  strata::tui::configure_trace_outputs(args.trace_outputs);
  strata::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      strata::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    strata::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  strata::termination_handler_install();

  auto cmd{ std::visit(
      [&args](auto const &cfg) { return strata::cmd::create(cfg, args.globals); },
      *args.cmd_cfg) };

  bool ok{ false };
  try {
    ok = cmd->execute();
  } catch (std::exception const &ex) {
    strata::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
