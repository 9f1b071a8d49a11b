#pragma once

#include "hook.h"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keel {
struct chart;
}

// Release schema v1: lifecycle events and policies are closed enumerations.
namespace keel::v1 {

enum class hook_event {
  pre_install,
  post_install,
  pre_delete,
  post_delete,
  pre_upgrade,
  post_upgrade,
  pre_rollback,
  post_rollback,
  test,
};

enum class hook_delete_policy { before_hook_creation, hook_succeeded, hook_failed };

enum class hook_output_log_policy { hook_succeeded, hook_failed };

std::string_view hook_event_name(hook_event e);
std::optional<hook_event> hook_event_parse(std::string_view name);
std::string_view hook_delete_policy_name(hook_delete_policy p);
std::string_view hook_output_log_policy_name(hook_output_log_policy p);

struct hook_execution {
  std::chrono::system_clock::time_point started_at;
  std::chrono::system_clock::time_point completed_at;
  hook_phase phase{ hook_phase::unknown };
};

struct hook {
  std::string name;
  std::string kind;
  std::string path;
  std::string manifest;
  std::vector<hook_event> events;
  hook_execution last_run;
  int weight{ 0 };
  std::vector<hook_delete_policy> delete_policies;
  std::vector<hook_output_log_policy> output_log_policies;
};

enum class status {
  unknown,
  deployed,
  uninstalled,
  superseded,
  failed,
  uninstalling,
  pending_install,
  pending_upgrade,
  pending_rollback,
};

std::string_view status_name(status s);

struct release_info {
  std::chrono::system_clock::time_point first_deployed;
  std::chrono::system_clock::time_point last_deployed;
  std::string description;
  status state{ status::unknown };
  std::string notes;
};

struct release {
  std::string name;
  std::string namespace_name;
  int version{ 0 };
  release_info info;
  std::shared_ptr<keel::chart const> chart;
  std::string manifest;
  std::vector<hook> hooks;
  std::map<std::string, std::string> labels;
  std::string apply_method;
};

}  // namespace keel::v1
