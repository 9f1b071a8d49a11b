#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace keel {

namespace trace_events {

struct hook_selected {
  std::string event;
  std::string hook;
  std::int64_t weight;
  std::int64_t position;
};

struct hook_phase_changed {
  std::string event;
  std::string hook;
  std::string phase;
};

struct hook_deleted {
  std::string hook;
  std::string policy;
  std::string kind;
};

struct hook_logs_output {
  std::string hook;
  std::string policy;
  std::string namespace_name;
  std::string selector;
};

struct graph_built {
  std::string chart;
  std::int64_t node_count;
  std::int64_t edge_count;
  std::int64_t tier_count;
};

struct tier_start {
  std::string chart;
  std::int64_t tier;
  std::string nodes;
};

struct tier_complete {
  std::string chart;
  std::int64_t tier;
  std::int64_t duration_ms;
};

struct chart_install_complete {
  std::string chart;
  bool ordered;
  std::int64_t duration_ms;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::hook_selected,
                                   trace_events::hook_phase_changed,
                                   trace_events::hook_deleted,
                                   trace_events::hook_logs_output,
                                   trace_events::graph_built,
                                   trace_events::tier_start,
                                   trace_events::tier_complete,
                                   trace_events::chart_install_complete>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);
}  // namespace tui

}  // namespace keel

#define KEEL_TRACE_UNLIKELY [[unlikely]]

#define KEEL_TRACE_EMIT(event_expr) \
  do { \
    if (::keel::tui::g_trace_enabled) KEEL_TRACE_UNLIKELY { \
        ::keel::tui::trace event_expr; \
      } \
  } while (0)

#define KEEL_TRACE_HOOK_SELECTED(event_value, hook_value, weight_value, position_value) \
  KEEL_TRACE_EMIT((::keel::trace_events::hook_selected{ \
      .event = std::string(event_value), \
      .hook = (hook_value), \
      .weight = static_cast<std::int64_t>(weight_value), \
      .position = static_cast<std::int64_t>(position_value), \
  }))

#define KEEL_TRACE_HOOK_PHASE_CHANGED(event_value, hook_value, phase_value) \
  KEEL_TRACE_EMIT((::keel::trace_events::hook_phase_changed{ \
      .event = std::string(event_value), \
      .hook = (hook_value), \
      .phase = std::string(phase_value), \
  }))

#define KEEL_TRACE_HOOK_DELETED(hook_value, policy_value, kind_value) \
  KEEL_TRACE_EMIT((::keel::trace_events::hook_deleted{ \
      .hook = (hook_value), \
      .policy = std::string(policy_value), \
      .kind = (kind_value), \
  }))

#define KEEL_TRACE_HOOK_LOGS_OUTPUT(hook_value, policy_value, ns_value, selector_value) \
  KEEL_TRACE_EMIT((::keel::trace_events::hook_logs_output{ \
      .hook = (hook_value), \
      .policy = std::string(policy_value), \
      .namespace_name = (ns_value), \
      .selector = (selector_value), \
  }))

#define KEEL_TRACE_GRAPH_BUILT(chart_value, nodes_value, edges_value, tiers_value) \
  KEEL_TRACE_EMIT((::keel::trace_events::graph_built{ \
      .chart = (chart_value), \
      .node_count = static_cast<std::int64_t>(nodes_value), \
      .edge_count = static_cast<std::int64_t>(edges_value), \
      .tier_count = static_cast<std::int64_t>(tiers_value), \
  }))

#define KEEL_TRACE_TIER_START(chart_value, tier_value, nodes_value) \
  KEEL_TRACE_EMIT((::keel::trace_events::tier_start{ \
      .chart = (chart_value), \
      .tier = static_cast<std::int64_t>(tier_value), \
      .nodes = (nodes_value), \
  }))

#define KEEL_TRACE_TIER_COMPLETE(chart_value, tier_value, duration_value) \
  KEEL_TRACE_EMIT((::keel::trace_events::tier_complete{ \
      .chart = (chart_value), \
      .tier = static_cast<std::int64_t>(tier_value), \
      .duration_ms = (duration_value), \
  }))

#define KEEL_TRACE_CHART_INSTALL_COMPLETE(chart_value, ordered_value, duration_value) \
  KEEL_TRACE_EMIT((::keel::trace_events::chart_install_complete{ \
      .chart = (chart_value), \
      .ordered = (ordered_value), \
      .duration_ms = (duration_value), \
  }))
