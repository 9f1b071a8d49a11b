#include "release_v1.h"

#include <algorithm>
#include <array>

namespace keel::v1 {

namespace {

constinit std::array<std::string_view, 9> const hook_event_name_table{ {
    "pre-install",    // hook_event::pre_install
    "post-install",   // hook_event::post_install
    "pre-delete",     // hook_event::pre_delete
    "post-delete",    // hook_event::post_delete
    "pre-upgrade",    // hook_event::pre_upgrade
    "post-upgrade",   // hook_event::post_upgrade
    "pre-rollback",   // hook_event::pre_rollback
    "post-rollback",  // hook_event::post_rollback
    "test",           // hook_event::test
} };

constinit std::array<std::string_view, 9> const status_name_table{ {
    "unknown",
    "deployed",
    "uninstalled",
    "superseded",
    "failed",
    "uninstalling",
    "pending-install",
    "pending-upgrade",
    "pending-rollback",
} };

}  // namespace

std::string_view hook_event_name(hook_event e) {
  auto const idx{ static_cast<std::size_t>(e) };
  if (idx >= hook_event_name_table.size()) { return "unknown"; }
  return hook_event_name_table[idx];
}

std::optional<hook_event> hook_event_parse(std::string_view name) {
  if (auto it{ std::ranges::find(hook_event_name_table, name) };
      it != hook_event_name_table.end()) {
    return static_cast<hook_event>(std::distance(hook_event_name_table.begin(), it));
  }
  return std::nullopt;
}

std::string_view hook_delete_policy_name(hook_delete_policy p) {
  switch (p) {
    case hook_delete_policy::before_hook_creation: return kHookDeletePolicyBeforeCreation;
    case hook_delete_policy::hook_succeeded: return kHookDeletePolicySucceeded;
    case hook_delete_policy::hook_failed: return kHookDeletePolicyFailed;
  }
  return "unknown";
}

std::string_view hook_output_log_policy_name(hook_output_log_policy p) {
  switch (p) {
    case hook_output_log_policy::hook_succeeded: return kHookOutputPolicySucceeded;
    case hook_output_log_policy::hook_failed: return kHookOutputPolicyFailed;
  }
  return "unknown";
}

std::string_view status_name(status s) {
  auto const idx{ static_cast<std::size_t>(s) };
  if (idx >= status_name_table.size()) { return "unknown"; }
  return status_name_table[idx];
}

}  // namespace keel::v1
