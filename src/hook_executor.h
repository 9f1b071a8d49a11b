#pragma once

#include "kube_client.h"
#include "release_accessor.h"
#include "release_store.h"
#include "util.h"
#include "wait_strategy.h"

#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <string_view>

namespace keel {

struct hook_exec_options {
  wait_strategy strategy{ wait_strategy::legacy };
  std::chrono::seconds timeout{ 300 };
  bool server_side_apply{ false };
};

// Cleanup step handed back by a hook run. Default-constructed instances do nothing.
// Invoking throws the cleanup's error, if any.
class deferred_shutdown {
 public:
  deferred_shutdown() = default;
  explicit deferred_shutdown(std::function<void()> fn) : fn_{ std::move(fn) } {}

  void operator()() const {
    if (fn_) { fn_(); }
  }

  bool is_noop() const { return !fn_; }

 private:
  std::function<void()> fn_;
};

// Outcome of running the hooks of one event. error is null on success; shutdown is
// valid either way and must be invoked by the caller once it is done with the hooks.
struct hook_exec_result {
  deferred_shutdown shutdown;
  std::exception_ptr error;

  bool ok() const { return !error; }
};

// Release-specific operations used while running hooks. delete_by_policy and
// output_logs_by_policy throw on failure.
struct hook_exec_callbacks {
  std::function<void()> record_release;
  std::function<void(hook_accessor &, std::string_view policy)> delete_by_policy;
  std::function<void(hook_accessor &, std::string_view policy)> output_logs_by_policy;
};

// Stable order by weight, then by name.
void hooks_sort_by_weight(hook_accessor_list &hooks);

// Run hooks sequentially in weight order. Collaborator failures are captured in the
// result rather than thrown. The returned shutdown refers to the hooks, so the
// release they belong to must outlive it.
hook_exec_result hook_exec_core(kube_client &kube,
                                hook_accessor_list hooks,
                                std::string_view event,
                                hook_exec_options const &opts,
                                hook_exec_callbacks callbacks);

// Namespace from the hook manifest's metadata.namespace, else release_namespace.
std::string hook_derive_namespace(hook_accessor const &h, std::string_view release_namespace);

class hook_executor : unmovable {
 public:
  hook_executor(kube_client &kube, release_store &store, hook_output_fn output);

  // Run every hook bound to event. The release, and this executor, must stay alive
  // until the returned shutdown has been invoked.
  hook_exec_result exec_hook_with_delayed_shutdown(release_ref rel,
                                                   std::string_view event,
                                                   hook_exec_options const &opts);

  // Run hooks and clean up immediately. Throws the first relevant error.
  void exec_hook(release_ref rel, std::string_view event, hook_exec_options const &opts);

  void delete_hook_by_policy(hook_accessor &h,
                             std::string_view policy,
                             hook_exec_options const &opts);
  void output_logs_by_policy(hook_accessor const &h,
                             std::string_view release_namespace,
                             std::string_view policy);

 private:
  void record_release(release_ref rel);

  kube_client &kube_;
  release_store &store_;
  hook_output_fn output_;
};

}  // namespace keel
