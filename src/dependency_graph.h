#pragma once

#include "chart.h"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace keel {

// Ordering constraints among the direct subcharts of one chart. An edge a -> b means
// a must be ready before b is installed.
struct dependency_graph {
  std::string owner;
  std::vector<std::string> nodes;  // declaration order
  std::map<std::string, std::set<std::string>> predecessors;
  std::map<std::string, std::set<std::string>> successors;

  std::size_t edge_count() const;

  // No edge in either direction.
  bool is_isolated(std::string const &node) const;
};

struct install_plan {
  std::vector<std::vector<std::string>> tiers;

  // Isolated sub-units, installed in the final batch with the owner's own resources.
  std::vector<std::string> with_owner;
};

// Throws keel::error when a sub-unit names a dependency that is not a sibling.
dependency_graph dependency_graph_build(chart const &c);

// Throws cycle_error naming the nodes of the first cycle found.
void dependency_graph_validate(dependency_graph const &g);

// Validates, then peels tiers: each tier holds every remaining connected node whose
// predecessors are all in earlier tiers, sorted by name.
install_plan dependency_graph_plan(dependency_graph const &g);

}  // namespace keel
