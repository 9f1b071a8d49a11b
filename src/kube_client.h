#pragma once

#include "wait_strategy.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace keel {

// One applyable object built from manifest text.
struct resource {
  std::string kind;
  std::string name;
  std::string namespace_name;
  std::string manifest;
};

using resource_list = std::vector<resource>;

struct create_options {
  bool server_side_apply{ false };
  bool force_conflicts{ false };
};

enum class deletion_propagation { background, foreground, orphan };

struct pod {
  std::string name;
  std::string namespace_name;
  std::vector<std::string> containers;
};

using pod_list = std::vector<pod>;

struct pod_list_options {
  std::string label_selector;
  std::string field_selector;
};

// Receives one container's log text.
using hook_output_fn = std::function<void(std::string_view namespace_name,
                                          std::string_view pod,
                                          std::string_view container,
                                          std::string_view text)>;

// Readiness and deletion observer. All methods block until done or timeout and
// throw on failure; a timeout is reported the same way as a failed resource.
class waiter {
 public:
  virtual ~waiter() = default;

  virtual void watch_until_ready(resource_list const &resources,
                                 std::chrono::seconds timeout) = 0;
  virtual void wait_for_delete(resource_list const &resources,
                               std::chrono::seconds timeout) = 0;

  // Readiness of a whole batch (deployments, services, jobs...).
  virtual void wait(resource_list const &resources, std::chrono::seconds timeout) = 0;
};

// Cluster API surface. Implementations throw on failure except remove(), which
// returns one message per resource that could not be deleted. The installer
// calls build, create and get_waiter from concurrent tier tasks, so
// implementations must be thread-safe; each waiter is used by one task.
class kube_client {
 public:
  virtual ~kube_client() = default;

  virtual resource_list build(std::string_view manifest, bool validate) = 0;
  virtual void create(resource_list const &resources, create_options const &opts) = 0;
  virtual std::vector<std::string> remove(resource_list const &resources,
                                          deletion_propagation propagation) = 0;
  virtual std::unique_ptr<waiter> get_waiter(wait_strategy strategy) = 0;

  virtual pod_list get_pod_list(std::string_view namespace_name,
                                pod_list_options const &opts) = 0;
  virtual void output_container_logs(pod_list const &pods,
                                     std::string_view namespace_name,
                                     hook_output_fn const &sink) = 0;
};

}  // namespace keel
