#include "cmds/cmd_version.h"

#include "doctest/doctest.h"

#include <type_traits>

TEST_CASE("cmd_version config exposes cmd_t alias") {
  using config_type = strata::cmd_version::cfg;
  using expected_command = strata::cmd_version;
  using actual_command = config_type::cmd_t;

  CHECK(std::is_same_v<actual_command, expected_command>);
}

TEST_CASE("cmd_version executes") {
  strata::cmd_version cmd{ strata::cmd_version::cfg{}, strata::cmd_globals{} };
  CHECK(cmd.execute());
}
