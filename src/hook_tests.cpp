#include "hook.h"

#include <doctest/doctest.h>

TEST_CASE("hook_phase_name: all values") {
  CHECK(keel::hook_phase_name(keel::hook_phase::unknown) == "Unknown");
  CHECK(keel::hook_phase_name(keel::hook_phase::running) == "Running");
  CHECK(keel::hook_phase_name(keel::hook_phase::succeeded) == "Succeeded");
  CHECK(keel::hook_phase_name(keel::hook_phase::failed) == "Failed");
}

TEST_CASE("hook_phase_parse") {
  CHECK(keel::hook_phase_parse("Failed") == keel::hook_phase::failed);
  CHECK(keel::hook_phase_parse("Running") == keel::hook_phase::running);
  CHECK_FALSE(keel::hook_phase_parse("failed").has_value());
  CHECK_FALSE(keel::hook_phase_parse("").has_value());
}
