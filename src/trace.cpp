#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace keel {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm utc_tm{};
  gmtime_r(&timestamp, &utc_tm);

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(bool_string(value));
}

}  // namespace

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(match{
                        TRACE_NAME(hook_selected),
                        TRACE_NAME(hook_phase_changed),
                        TRACE_NAME(hook_deleted),
                        TRACE_NAME(hook_logs_output),
                        TRACE_NAME(graph_built),
                        TRACE_NAME(tier_start),
                        TRACE_NAME(tier_complete),
                        TRACE_NAME(chart_install_complete),
                    },
                    event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::hook_selected const &value) {
            std::ostringstream oss;
            oss << "hook_selected event=" << value.event << " hook=" << value.hook
                << " weight=" << value.weight << " position=" << value.position;
            return oss.str();
          },
          [](trace_events::hook_phase_changed const &value) {
            std::ostringstream oss;
            oss << "hook_phase_changed event=" << value.event << " hook=" << value.hook
                << " phase=" << value.phase;
            return oss.str();
          },
          [](trace_events::hook_deleted const &value) {
            std::ostringstream oss;
            oss << "hook_deleted hook=" << value.hook << " policy=" << value.policy
                << " kind=" << value.kind;
            return oss.str();
          },
          [](trace_events::hook_logs_output const &value) {
            std::ostringstream oss;
            oss << "hook_logs_output hook=" << value.hook << " policy=" << value.policy
                << " namespace=" << value.namespace_name
                << " selector=" << value.selector;
            return oss.str();
          },
          [](trace_events::graph_built const &value) {
            std::ostringstream oss;
            oss << "graph_built chart=" << value.chart << " nodes=" << value.node_count
                << " edges=" << value.edge_count << " tiers=" << value.tier_count;
            return oss.str();
          },
          [](trace_events::tier_start const &value) {
            std::ostringstream oss;
            oss << "tier_start chart=" << value.chart << " tier=" << value.tier
                << " nodes=" << value.nodes;
            return oss.str();
          },
          [](trace_events::tier_complete const &value) {
            std::ostringstream oss;
            oss << "tier_complete chart=" << value.chart << " tier=" << value.tier
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::chart_install_complete const &value) {
            std::ostringstream oss;
            oss << "chart_install_complete chart=" << value.chart
                << " ordered=" << bool_string(value.ordered)
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string out{ "{\"ts\":\"" };
  out.append(format_timestamp(std::chrono::system_clock::now()));
  out.append("\",\"event\":\"");
  out.append(trace_event_name(event));
  out.push_back('"');

  std::visit(match{
                 [&](trace_events::hook_selected const &value) {
                   append_kv(out, "hook_event", value.event);
                   append_kv(out, "hook", value.hook);
                   append_kv(out, "weight", value.weight);
                   append_kv(out, "position", value.position);
                 },
                 [&](trace_events::hook_phase_changed const &value) {
                   append_kv(out, "hook_event", value.event);
                   append_kv(out, "hook", value.hook);
                   append_kv(out, "phase", value.phase);
                 },
                 [&](trace_events::hook_deleted const &value) {
                   append_kv(out, "hook", value.hook);
                   append_kv(out, "policy", value.policy);
                   append_kv(out, "kind", value.kind);
                 },
                 [&](trace_events::hook_logs_output const &value) {
                   append_kv(out, "hook", value.hook);
                   append_kv(out, "policy", value.policy);
                   append_kv(out, "namespace", value.namespace_name);
                   append_kv(out, "selector", value.selector);
                 },
                 [&](trace_events::graph_built const &value) {
                   append_kv(out, "chart", value.chart);
                   append_kv(out, "node_count", value.node_count);
                   append_kv(out, "edge_count", value.edge_count);
                   append_kv(out, "tier_count", value.tier_count);
                 },
                 [&](trace_events::tier_start const &value) {
                   append_kv(out, "chart", value.chart);
                   append_kv(out, "tier", value.tier);
                   append_kv(out, "nodes", value.nodes);
                 },
                 [&](trace_events::tier_complete const &value) {
                   append_kv(out, "chart", value.chart);
                   append_kv(out, "tier", value.tier);
                   append_kv(out, "duration_ms", value.duration_ms);
                 },
                 [&](trace_events::chart_install_complete const &value) {
                   append_kv(out, "chart", value.chart);
                   append_kv(out, "ordered", value.ordered);
                   append_kv(out, "duration_ms", value.duration_ms);
                 },
             },
             event);

  out.push_back('}');
  return out;
}

}  // namespace keel
