#include "trace.h"

#include <doctest/doctest.h>

#include <string>

namespace keel {

TEST_CASE("trace_event_name: reports the event type") {
  trace_event_t const ev{ trace_events::tier_start{
      .chart = "foo", .tier = 1, .nodes = "nginx,rabbitmq" } };
  CHECK(trace_event_name(ev) == "tier_start");
}

TEST_CASE("trace_event_to_string: key=value rendering") {
  trace_event_t const ev{ trace_events::hook_phase_changed{
      .event = "pre-install", .hook = "db-migrate", .phase = "Running" } };
  CHECK(trace_event_to_string(ev) ==
        "hook_phase_changed event=pre-install hook=db-migrate phase=Running");
}

TEST_CASE("trace_event_to_string: booleans render as words") {
  trace_event_t const ev{ trace_events::chart_install_complete{
      .chart = "foo", .ordered = true, .duration_ms = 12 } };
  CHECK(trace_event_to_string(ev) ==
        "chart_install_complete chart=foo ordered=true duration_ms=12");
}

TEST_CASE("trace_event_to_json: fields and escaping") {
  trace_event_t const ev{ trace_events::hook_deleted{
      .hook = "a\"b", .policy = "hook-succeeded", .kind = "Job" } };
  std::string const json{ trace_event_to_json(ev) };

  CHECK(json.starts_with("{\"ts\":\""));
  CHECK(json.ends_with("}"));
  CHECK(json.find("\"event\":\"hook_deleted\"") != std::string::npos);
  CHECK(json.find("\"hook\":\"a\\\"b\"") != std::string::npos);
  CHECK(json.find("\"policy\":\"hook-succeeded\"") != std::string::npos);
}

TEST_CASE("trace_event_to_json: integers are unquoted") {
  trace_event_t const ev{ trace_events::graph_built{
      .chart = "foo", .node_count = 4, .edge_count = 2, .tier_count = 3 } };
  std::string const json{ trace_event_to_json(ev) };

  CHECK(json.find("\"node_count\":4") != std::string::npos);
  CHECK(json.find("\"edge_count\":2") != std::string::npos);
  CHECK(json.find("\"tier_count\":3") != std::string::npos);
}

}  // namespace keel
