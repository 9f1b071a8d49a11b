#include "hook.h"

#include <algorithm>
#include <array>

namespace keel {

namespace {

// Index = enum value (order must match hook_phase in hook.h)
constinit std::array<std::string_view, 4> const hook_phase_name_table{ {
    "Unknown",    // hook_phase::unknown (0)
    "Running",    // hook_phase::running (1)
    "Succeeded",  // hook_phase::succeeded (2)
    "Failed",     // hook_phase::failed (3)
} };

}  // namespace

std::string_view hook_phase_name(hook_phase p) {
  auto const idx{ static_cast<std::size_t>(p) };
  if (idx >= hook_phase_name_table.size()) { return "Unknown"; }
  return hook_phase_name_table[idx];
}

std::optional<hook_phase> hook_phase_parse(std::string_view name) {
  if (auto it{ std::ranges::find(hook_phase_name_table, name) };
      it != hook_phase_name_table.end()) {
    return static_cast<hook_phase>(std::distance(hook_phase_name_table.begin(), it));
  }
  return std::nullopt;
}

}  // namespace keel
