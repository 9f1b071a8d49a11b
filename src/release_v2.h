#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace keel {
struct chart;
}

// Release schema v2: events, policies, phase and status are stored as their wire
// strings so newer values round-trip through older binaries untouched.
namespace keel::v2 {

struct hook_execution {
  std::chrono::system_clock::time_point started_at;
  std::chrono::system_clock::time_point completed_at;
  std::string phase{ "Unknown" };
};

struct hook {
  std::string name;
  std::string kind;
  std::string path;
  std::string manifest;
  std::vector<std::string> events;
  hook_execution last_run;
  int weight{ 0 };
  std::vector<std::string> delete_policies;
  std::vector<std::string> output_log_policies;
};

struct release_info {
  std::chrono::system_clock::time_point first_deployed;
  std::chrono::system_clock::time_point last_deployed;
  std::string description;
  std::string status{ "unknown" };
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

}  // namespace keel::v2
