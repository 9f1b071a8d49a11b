#include "cmds/cmd_version.h"

#include <doctest/doctest.h>

TEST_CASE("cmd_version config exposes cmd_t alias") {
  using config_type = keel::cmd_version::cfg;
  using expected_command = keel::cmd_version;
  using actual_command = config_type::cmd_t;

  CHECK(std::is_same_v<actual_command, expected_command>);
}

TEST_CASE("cmd_version execute prints without throwing") {
  keel::cmd_version cmd{ keel::cmd_version::cfg{} };
  CHECK_NOTHROW(cmd.execute());
}
