#include "release_accessor.h"

#include "errors.h"
#include "util.h"

#include <algorithm>

namespace keel {

namespace {

class v1_hook_accessor : public hook_accessor {
 public:
  explicit v1_hook_accessor(v1::hook *hook) : hook_{ hook } {}

  std::string const &path() const override { return hook_->path; }
  std::string const &manifest() const override { return hook_->manifest; }
  std::string const &name() const override { return hook_->name; }
  std::string const &kind() const override { return hook_->kind; }
  int weight() const override { return hook_->weight; }

  bool has_event(std::string_view event) const override {
    return std::ranges::any_of(hook_->events, [event](v1::hook_event e) {
      return v1::hook_event_name(e) == event;
    });
  }

  bool has_delete_policy(std::string_view policy) const override {
    return std::ranges::any_of(hook_->delete_policies, [policy](v1::hook_delete_policy p) {
      return v1::hook_delete_policy_name(p) == policy;
    });
  }

  bool has_output_log_policy(std::string_view policy) const override {
    return std::ranges::any_of(hook_->output_log_policies,
                               [policy](v1::hook_output_log_policy p) {
                                 return v1::hook_output_log_policy_name(p) == policy;
                               });
  }

  void set_default_delete_policy() override {
    if (hook_->delete_policies.empty()) {
      hook_->delete_policies = { v1::hook_delete_policy::before_hook_creation };
    }
  }

  void set_last_run_started() override {
    hook_->last_run = v1::hook_execution{ .started_at = std::chrono::system_clock::now(),
                                          .completed_at = {},
                                          .phase = hook_phase::running };
  }

  void set_last_run_phase(hook_phase phase) override { hook_->last_run.phase = phase; }

  void set_last_run_completed() override {
    hook_->last_run.completed_at = std::chrono::system_clock::now();
  }

 private:
  v1::hook *hook_;
};

class v2_hook_accessor : public hook_accessor {
 public:
  explicit v2_hook_accessor(v2::hook *hook) : hook_{ hook } {}

  std::string const &path() const override { return hook_->path; }
  std::string const &manifest() const override { return hook_->manifest; }
  std::string const &name() const override { return hook_->name; }
  std::string const &kind() const override { return hook_->kind; }
  int weight() const override { return hook_->weight; }

  bool has_event(std::string_view event) const override {
    return std::ranges::find(hook_->events, event) != hook_->events.end();
  }

  bool has_delete_policy(std::string_view policy) const override {
    return std::ranges::find(hook_->delete_policies, policy) !=
           hook_->delete_policies.end();
  }

  bool has_output_log_policy(std::string_view policy) const override {
    return std::ranges::find(hook_->output_log_policies, policy) !=
           hook_->output_log_policies.end();
  }

  void set_default_delete_policy() override {
    if (hook_->delete_policies.empty()) {
      hook_->delete_policies = { std::string{ kHookDeletePolicyBeforeCreation } };
    }
  }

  void set_last_run_started() override {
    hook_->last_run =
        v2::hook_execution{ .started_at = std::chrono::system_clock::now(),
                            .completed_at = {},
                            .phase = std::string{ hook_phase_name(hook_phase::running) } };
  }

  void set_last_run_phase(hook_phase phase) override {
    hook_->last_run.phase = std::string{ hook_phase_name(phase) };
  }

  void set_last_run_completed() override {
    hook_->last_run.completed_at = std::chrono::system_clock::now();
  }

 private:
  v2::hook *hook_;
};

class v1_release_accessor : public release_accessor {
 public:
  explicit v1_release_accessor(v1::release *rel) : rel_{ rel } {}

  std::string const &name() const override { return rel_->name; }
  std::string const &namespace_name() const override { return rel_->namespace_name; }
  int version() const override { return rel_->version; }

  hook_accessor_list hooks() const override {
    hook_accessor_list result;
    result.reserve(rel_->hooks.size());
    for (auto &h : rel_->hooks) { result.push_back(std::make_unique<v1_hook_accessor>(&h)); }
    return result;
  }

  std::string const &manifest() const override { return rel_->manifest; }
  std::string const &notes() const override { return rel_->info.notes; }
  std::map<std::string, std::string> const &labels() const override {
    return rel_->labels;
  }
  std::shared_ptr<chart const> chart_ref() const override { return rel_->chart; }
  std::string status() const override { return std::string{ v1::status_name(rel_->info.state) }; }
  std::string const &apply_method() const override { return rel_->apply_method; }
  std::chrono::system_clock::time_point deployed_at() const override {
    return rel_->info.last_deployed;
  }

 private:
  v1::release *rel_;
};

class v2_release_accessor : public release_accessor {
 public:
  explicit v2_release_accessor(v2::release *rel) : rel_{ rel } {}

  std::string const &name() const override { return rel_->name; }
  std::string const &namespace_name() const override { return rel_->namespace_name; }
  int version() const override { return rel_->version; }

  hook_accessor_list hooks() const override {
    hook_accessor_list result;
    result.reserve(rel_->hooks.size());
    for (auto &h : rel_->hooks) { result.push_back(std::make_unique<v2_hook_accessor>(&h)); }
    return result;
  }

  std::string const &manifest() const override { return rel_->manifest; }
  std::string const &notes() const override { return rel_->info.notes; }
  std::map<std::string, std::string> const &labels() const override {
    return rel_->labels;
  }
  std::shared_ptr<chart const> chart_ref() const override { return rel_->chart; }
  std::string status() const override { return rel_->info.status; }
  std::string const &apply_method() const override { return rel_->apply_method; }
  std::chrono::system_clock::time_point deployed_at() const override {
    return rel_->info.last_deployed;
  }

 private:
  v2::release *rel_;
};

}  // namespace

std::unique_ptr<release_accessor> release_accessor_create(release_ref rel) {
  return std::visit(
      match{
          [](std::monostate) -> std::unique_ptr<release_accessor> {
            throw unsupported_schema_error("unsupported release type");
          },
          [](v1::release *r) -> std::unique_ptr<release_accessor> {
            if (!r) { throw unsupported_schema_error("unsupported release type: null"); }
            return std::make_unique<v1_release_accessor>(r);
          },
          [](v2::release *r) -> std::unique_ptr<release_accessor> {
            if (!r) { throw unsupported_schema_error("unsupported release type: null"); }
            return std::make_unique<v2_release_accessor>(r);
          },
      },
      rel);
}

std::unique_ptr<hook_accessor> hook_accessor_create(hook_ref hook) {
  return std::visit(
      match{
          [](std::monostate) -> std::unique_ptr<hook_accessor> {
            throw unsupported_schema_error("unsupported release hook type");
          },
          [](v1::hook *h) -> std::unique_ptr<hook_accessor> {
            if (!h) { throw unsupported_schema_error("unsupported release hook type: null"); }
            return std::make_unique<v1_hook_accessor>(h);
          },
          [](v2::hook *h) -> std::unique_ptr<hook_accessor> {
            if (!h) { throw unsupported_schema_error("unsupported release hook type: null"); }
            return std::make_unique<v2_hook_accessor>(h);
          },
      },
      hook);
}

}  // namespace keel
