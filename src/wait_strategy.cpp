#include "wait_strategy.h"

#include <algorithm>
#include <array>

namespace keel {

namespace {

// Index = enum value (order must match wait_strategy in wait_strategy.h)
constinit std::array<std::string_view, 3> const wait_strategy_name_table{ {
    "none",     // wait_strategy::none (0)
    "legacy",   // wait_strategy::legacy (1)
    "ordered",  // wait_strategy::ordered (2)
} };

}  // namespace

std::string_view wait_strategy_name(wait_strategy s) {
  auto const idx{ static_cast<std::size_t>(s) };
  if (idx >= wait_strategy_name_table.size()) { return "unknown"; }
  return wait_strategy_name_table[idx];
}

std::optional<wait_strategy> wait_strategy_parse(std::string_view name) {
  if (auto it{ std::ranges::find(wait_strategy_name_table, name) };
      it != wait_strategy_name_table.end()) {
    return static_cast<wait_strategy>(std::distance(wait_strategy_name_table.begin(), it));
  }
  return std::nullopt;
}

}  // namespace keel
