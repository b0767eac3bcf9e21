#include "cmd_common.h"

#include "platform.h"
#include "tui.h"
#include "util.h"

#include <iostream>
#include <string>

namespace strata {

namespace {

char op_marker(op_kind kind) {
  switch (kind) {
    case op_kind::create: return '+';
    case op_kind::update: return '~';
    case op_kind::remove: return '-';
    case op_kind::no_op: return ' ';
  }
  return '?';
}

}  // namespace

init_params cmd_make_init_params(cmd_globals const &globals, std::size_t jobs) {
  init_params params{};
  params.root = globals.root;
  params.profile = globals.profile;
  params.max_parallelism = jobs;
  return params;
}

void cmd_print_previews(std::vector<preview_result> const &previews) {
  for (auto const &p : previews) {
    tui::print_stdout("%s\n", p.summary.c_str());
    for (auto const &c : p.changes) {
      if (c.op == op_kind::no_op) { continue; }
      tui::print_stdout("  %c %s/%s\n", op_marker(c.op), c.type.c_str(), c.name.c_str());
    }
  }
}

void cmd_print_report(provision_report const &report) {
  for (auto const &outcome : report.stacks) {
    std::string const status{ stack_status_name(outcome.status) };
    if (outcome.detail.empty()) {
      tui::print_stdout("%s: %s\n", outcome.stack.c_str(), status.c_str());
    } else {
      tui::print_stdout("%s: %s (%s)\n",
                        outcome.stack.c_str(),
                        status.c_str(),
                        outcome.detail.c_str());
    }
  }

  std::string const phase{ run_phase_name(report.phase) };
  tui::print_stdout("run %llu %s\n",
                    static_cast<unsigned long long>(report.run_id),
                    phase.c_str());
}

bool cmd_prompt_yes_no(char const *question) {
  if (!platform::stdin_is_tty() || !tui::is_tty()) { return false; }

  tui::interactive_mode_guard guard;
  tui::flush();
  std::cerr << question << " [y/N] " << std::flush;

  std::string answer;
  if (!std::getline(std::cin, answer)) { return false; }
  auto const trimmed{ util_trim(answer) };
  return trimmed == "y" || trimmed == "Y" || trimmed == "yes";
}

}  // namespace strata
