#pragma once

#include "hook.h"
#include "release_v1.h"
#include "release_v2.h"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace keel {

struct chart;

// Schema-agnostic view of a single hook. Mutators write through to the underlying
// release record.
class hook_accessor {
 public:
  virtual ~hook_accessor() = default;

  virtual std::string const &path() const = 0;
  virtual std::string const &manifest() const = 0;
  virtual std::string const &name() const = 0;
  virtual std::string const &kind() const = 0;
  virtual int weight() const = 0;

  virtual bool has_event(std::string_view event) const = 0;
  virtual bool has_delete_policy(std::string_view policy) const = 0;
  virtual bool has_output_log_policy(std::string_view policy) const = 0;

  // No-op when any delete policy is already present.
  virtual void set_default_delete_policy() = 0;

  // Resets the last run record: start time now, phase running, no completion time.
  virtual void set_last_run_started() = 0;
  virtual void set_last_run_phase(hook_phase phase) = 0;
  virtual void set_last_run_completed() = 0;
};

using hook_accessor_list = std::vector<std::unique_ptr<hook_accessor>>;

// Schema-agnostic view of a release snapshot.
class release_accessor {
 public:
  virtual ~release_accessor() = default;

  virtual std::string const &name() const = 0;
  virtual std::string const &namespace_name() const = 0;
  virtual int version() const = 0;
  virtual hook_accessor_list hooks() const = 0;
  virtual std::string const &manifest() const = 0;
  virtual std::string const &notes() const = 0;
  virtual std::map<std::string, std::string> const &labels() const = 0;
  virtual std::shared_ptr<chart const> chart_ref() const = 0;
  virtual std::string status() const = 0;
  virtual std::string const &apply_method() const = 0;
  virtual std::chrono::system_clock::time_point deployed_at() const = 0;
};

// Non-owning references to a concrete schema value. std::monostate stands for a value
// of no known schema.
using release_ref = std::variant<std::monostate, v1::release *, v2::release *>;
using hook_ref = std::variant<std::monostate, v1::hook *, v2::hook *>;

// Throw unsupported_schema_error for monostate or null pointers.
std::unique_ptr<release_accessor> release_accessor_create(release_ref rel);
std::unique_ptr<hook_accessor> hook_accessor_create(hook_ref hook);

}  // namespace keel
