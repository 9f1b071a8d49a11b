#include "hook_executor.h"

#include "errors.h"
#include "hook.h"
#include "trace.h"
#include "tui.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <memory>

namespace keel {

namespace {

template <typename E>
hook_exec_result failed_result(E err) {
  return { .shutdown = {}, .error = std::make_exception_ptr(std::move(err)) };
}

}  // namespace

void hooks_sort_by_weight(hook_accessor_list &hooks) {
  std::ranges::stable_sort(hooks, [](auto const &a, auto const &b) {
    if (a->weight() != b->weight()) { return a->weight() < b->weight(); }
    return a->name() < b->name();
  });
}

hook_exec_result hook_exec_core(kube_client &kube,
                                hook_accessor_list hooks,
                                std::string_view event,
                                hook_exec_options const &opts,
                                hook_exec_callbacks callbacks) {
  hooks_sort_by_weight(hooks);
  for (std::size_t i{ 0 }; i < hooks.size(); ++i) {
    KEEL_TRACE_HOOK_SELECTED(event, hooks[i]->path(), hooks[i]->weight(), i);
  }

  // Shared with the returned shutdown, which runs after this frame is gone.
  auto const executing{ std::make_shared<hook_accessor_list>(std::move(hooks)) };
  auto const cb{ std::make_shared<hook_exec_callbacks const>(std::move(callbacks)) };
  std::string const event_name{ event };

  for (std::size_t i{ 0 }; i < executing->size(); ++i) {
    auto &h{ *(*executing)[i] };
    tui::debug("hook %s: running %s (weight %d)", event_name.c_str(), h.path().c_str(), h.weight());

    h.set_default_delete_policy();

    try {
      cb->delete_by_policy(h, kHookDeletePolicyBeforeCreation);
    } catch (std::exception const &) {
      return { .shutdown = {}, .error = std::current_exception() };
    }

    resource_list resources;
    try {
      resources = kube.build(h.manifest(), true);
    } catch (std::exception const &e) {
      return failed_result(manifest_build_error("unable to build kubernetes object for " +
                                                event_name + " hook " + h.path() + ": " +
                                                e.what()));
    }

    h.set_last_run_started();
    KEEL_TRACE_HOOK_PHASE_CHANGED(event_name, h.path(), hook_phase_name(hook_phase::running));
    cb->record_release();

    // Overwritten with a terminal phase below; left as is only if the watch never
    // returns normally.
    h.set_last_run_phase(hook_phase::unknown);

    try {
      kube.create(resources,
                  create_options{ .server_side_apply = opts.server_side_apply,
                                  .force_conflicts = false });
    } catch (std::exception const &e) {
      h.set_last_run_completed();
      h.set_last_run_phase(hook_phase::failed);
      KEEL_TRACE_HOOK_PHASE_CHANGED(event_name, h.path(), hook_phase_name(hook_phase::failed));
      return failed_result(apply_error("warning: Hook " + event_name + " " + h.path() +
                                       " failed: " + e.what()));
    }

    std::unique_ptr<waiter> w;
    try {
      w = kube.get_waiter(opts.strategy);
    } catch (std::exception const &e) {
      return failed_result(error(std::string{ "unable to get waiter: " } + e.what()));
    }

    std::exception_ptr watch_error;
    try {
      w->watch_until_ready(resources, opts.timeout);
    } catch (std::exception const &e) {
      watch_error = std::make_exception_ptr(readiness_error(
          "hook " + event_name + " " + h.path() + " did not become ready: " + e.what()));
    }
    h.set_last_run_completed();

    if (watch_error) {
      h.set_last_run_phase(hook_phase::failed);
      KEEL_TRACE_HOOK_PHASE_CHANGED(event_name, h.path(), hook_phase_name(hook_phase::failed));

      try {
        cb->output_logs_by_policy(h, kHookOutputPolicyFailed);
      } catch (std::exception const &e) {
        tui::warn("error outputting logs for hook failure: %s", e.what());
      }

      deferred_shutdown on_failure{ [executing, cb, i, watch_error] {
        try {
          cb->delete_by_policy(*(*executing)[i], kHookDeletePolicyFailed);
        } catch (std::exception const &e) {
          tui::warn("error deleting the hook resource on hook failure: %s", e.what());
        }

        for (std::size_t j{ 0 }; j < i; ++j) {
          cb->delete_by_policy(*(*executing)[j], kHookDeletePolicySucceeded);
        }

        std::rethrow_exception(watch_error);
      } };

      return { .shutdown = std::move(on_failure), .error = watch_error };
    }

    h.set_last_run_phase(hook_phase::succeeded);
    KEEL_TRACE_HOOK_PHASE_CHANGED(event_name, h.path(), hook_phase_name(hook_phase::succeeded));
  }

  deferred_shutdown on_success{ [executing, cb] {
    for (auto it{ executing->rbegin() }; it != executing->rend(); ++it) {
      auto &h{ **it };
      try {
        cb->output_logs_by_policy(h, kHookOutputPolicySucceeded);
      } catch (std::exception const &e) {
        tui::warn("error outputting logs for hook success: %s", e.what());
      }
      cb->delete_by_policy(h, kHookDeletePolicySucceeded);
    }
  } };

  return { .shutdown = std::move(on_success), .error = nullptr };
}

std::string hook_derive_namespace(hook_accessor const &h, std::string_view release_namespace) {
  try {
    auto const doc{ YAML::Load(h.manifest()) };
    if (doc.IsMap()) {
      if (auto const metadata{ doc["metadata"] }; metadata && metadata.IsMap()) {
        if (auto const ns{ metadata["namespace"] }; ns && !ns.IsNull()) {
          if (auto value{ ns.as<std::string>() }; !value.empty()) { return value; }
        }
      }
    }
  } catch (YAML::Exception const &e) {
    throw error("unable to parse metadata.namespace from kubernetes manifest for output "
                "logs hook " +
                h.path() + ": " + e.what());
  }
  return std::string{ release_namespace };
}

hook_executor::hook_executor(kube_client &kube, release_store &store, hook_output_fn output)
    : kube_{ kube }, store_{ store }, output_{ std::move(output) } {}

hook_exec_result hook_executor::exec_hook_with_delayed_shutdown(
    release_ref rel,
    std::string_view event,
    hook_exec_options const &opts) {
  std::unique_ptr<release_accessor> acc;
  try {
    acc = release_accessor_create(rel);
  } catch (unsupported_schema_error const &) {
    return { .shutdown = {}, .error = std::current_exception() };
  }

  hook_accessor_list executing;
  for (auto &h : acc->hooks()) {
    if (h->has_event(event)) { executing.push_back(std::move(h)); }
  }

  hook_exec_callbacks callbacks{
    .record_release = [this, rel] { record_release(rel); },
    .delete_by_policy =
        [this, opts](hook_accessor &h, std::string_view policy) {
          delete_hook_by_policy(h, policy, opts);
        },
    .output_logs_by_policy =
        [this, ns = acc->namespace_name()](hook_accessor &h, std::string_view policy) {
          output_logs_by_policy(h, ns, policy);
        },
  };

  return hook_exec_core(kube_, std::move(executing), event, opts, std::move(callbacks));
}

void hook_executor::exec_hook(release_ref rel,
                              std::string_view event,
                              hook_exec_options const &opts) {
  auto const result{ exec_hook_with_delayed_shutdown(rel, event, opts) };
  if (!result.ok()) {
    result.shutdown();  // a cleanup error takes precedence
    std::rethrow_exception(result.error);
  }
  result.shutdown();
}

void hook_executor::delete_hook_by_policy(hook_accessor &h,
                                          std::string_view policy,
                                          hook_exec_options const &opts) {
  // Deleting a CRD garbage-collects every custom resource of its type.
  if (h.kind() == kCustomResourceDefinitionKind) { return; }
  if (!h.has_delete_policy(policy)) { return; }

  resource_list resources;
  try {
    resources = kube_.build(h.manifest(), false);
  } catch (std::exception const &e) {
    throw cleanup_error("unable to build kubernetes object for deleting hook " + h.path() +
                        ": " + e.what());
  }

  if (auto const errs{ kube_.remove(resources, deletion_propagation::background) };
      !errs.empty()) {
    throw cleanup_error(util_join(errs, "; "));
  }

  try {
    kube_.get_waiter(opts.strategy)->wait_for_delete(resources, opts.timeout);
  } catch (std::exception const &e) {
    throw cleanup_error("hook " + h.path() + " was not deleted: " + e.what());
  }

  KEEL_TRACE_HOOK_DELETED(h.path(), policy, h.kind());
  tui::debug("hook %s: deleted by policy %.*s",
             h.path().c_str(),
             static_cast<int>(policy.size()),
             policy.data());
}

void hook_executor::output_logs_by_policy(hook_accessor const &h,
                                          std::string_view release_namespace,
                                          std::string_view policy) {
  if (!h.has_output_log_policy(policy)) { return; }

  auto const ns{ hook_derive_namespace(h, release_namespace) };

  pod_list_options list_opts;
  if (h.kind() == "Job") {
    list_opts.label_selector = "job-name=" + h.name();
  } else if (h.kind() == "Pod") {
    list_opts.field_selector = "metadata.name=" + h.name();
  } else {
    return;
  }

  KEEL_TRACE_HOOK_LOGS_OUTPUT(h.path(),
                              policy,
                              ns,
                              list_opts.label_selector.empty() ? list_opts.field_selector
                                                               : list_opts.label_selector);

  auto const pods{ kube_.get_pod_list(ns, list_opts) };
  kube_.output_container_logs(pods, ns, output_);
}

void hook_executor::record_release(release_ref rel) {
  try {
    store_.update(rel);
  } catch (std::exception const &e) {
    tui::warn("warning: Failed to update release: %s", e.what());
  }
}

}  // namespace keel
