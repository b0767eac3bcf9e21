#pragma once

#include "cmd.h"
#include "orchestrator.h"
#include "preview.h"
#include "provision_run.h"

#include <cstddef>
#include <vector>

namespace strata {

init_params cmd_make_init_params(cmd_globals const &globals, std::size_t jobs = 0);

// One summary line per stack, then "+ type/name" style lines for each change.
void cmd_print_previews(std::vector<preview_result> const &previews);

void cmd_print_report(provision_report const &report);

// Interactive y/N prompt. False unless both stdin and stderr are terminals.
bool cmd_prompt_yes_no(char const *question);

}  // namespace strata
