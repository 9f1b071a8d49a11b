#pragma once

#include <optional>
#include <string_view>

namespace keel {

enum class wait_strategy : int {
  none = 0,     // Do not block for readiness
  legacy = 1,   // Flat install, wait for everything at once
  ordered = 2,  // Dependency-ordered tiered install, wait between tiers
};

std::string_view wait_strategy_name(wait_strategy s);
std::optional<wait_strategy> wait_strategy_parse(std::string_view name);

}  // namespace keel
