#include "cmd_version.h"

#include "tui.h"

#include "CLI/CLI.hpp"
#include "mbedtls/version.h"
#include "sol/sol.hpp"
#include "tbb/version.h"

#include <array>

#ifndef STRATA_VERSION_STR
#error "STRATA_VERSION_STR must be defined by the build system"
#endif

namespace strata {

cmd_version::cmd_version(cmd_version::cfg cfg, cmd_globals /*globals*/)
    : cfg_{ std::move(cfg) } {}

bool cmd_version::execute() {
  tui::info("strata version %s", STRATA_VERSION_STR);
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  oneTBB: %s (runtime %s)", TBB_VERSION_STRING, TBB_runtime_version());

  std::array<char, 32> mbedtls_version{};
  mbedtls_version_get_string_full(mbedtls_version.data());
  tui::info("  mbedTLS: %s", mbedtls_version.data());

  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  CLI11: %s", CLI11_VERSION);
  return true;
}

}  // namespace strata
