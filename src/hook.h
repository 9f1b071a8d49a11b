#pragma once

#include <optional>
#include <string_view>

namespace keel {

// Policy strings shared by every release schema version
inline constexpr std::string_view kHookDeletePolicyBeforeCreation{ "before-hook-creation" };
inline constexpr std::string_view kHookDeletePolicySucceeded{ "hook-succeeded" };
inline constexpr std::string_view kHookDeletePolicyFailed{ "hook-failed" };

inline constexpr std::string_view kHookOutputPolicySucceeded{ "hook-succeeded" };
inline constexpr std::string_view kHookOutputPolicyFailed{ "hook-failed" };

inline constexpr std::string_view kCustomResourceDefinitionKind{ "CustomResourceDefinition" };

enum class hook_phase : int {
  unknown = 0,  // Not yet run, or the watch exited without a terminal phase
  running = 1,
  succeeded = 2,
  failed = 3,
};

std::string_view hook_phase_name(hook_phase p);
std::optional<hook_phase> hook_phase_parse(std::string_view name);

}  // namespace keel
