#include "dependency_graph.h"

#include "errors.h"
#include "util.h"

#include <algorithm>
#include <optional>

namespace keel {

namespace {

enum class visit_state { unvisited, in_progress, done };

// Depth-first search along successors; returns the cycle as a closed path.
std::optional<std::vector<std::string>> find_cycle(
    dependency_graph const &g,
    std::string const &node,
    std::map<std::string, visit_state> &state,
    std::vector<std::string> &stack) {
  state[node] = visit_state::in_progress;
  stack.push_back(node);

  if (auto const it{ g.successors.find(node) }; it != g.successors.end()) {
    for (auto const &next : it->second) {
      switch (state[next]) {
        case visit_state::in_progress: {
          auto const start{ std::ranges::find(stack, next) };
          std::vector<std::string> cycle{ start, stack.end() };
          cycle.push_back(next);
          return cycle;
        }
        case visit_state::unvisited:
          if (auto cycle{ find_cycle(g, next, state, stack) }) { return cycle; }
          break;
        case visit_state::done: break;
      }
    }
  }

  stack.pop_back();
  state[node] = visit_state::done;
  return std::nullopt;
}

}  // namespace

std::size_t dependency_graph::edge_count() const {
  std::size_t count{ 0 };
  for (auto const &[_, succ] : successors) { count += succ.size(); }
  return count;
}

bool dependency_graph::is_isolated(std::string const &node) const {
  auto const empty_in{ [](auto const &m, std::string const &n) {
    auto const it{ m.find(n) };
    return it == m.end() || it->second.empty();
  } };
  return empty_in(predecessors, node) && empty_in(successors, node);
}

dependency_graph dependency_graph_build(chart const &c) {
  dependency_graph g{ .owner = c.name };

  for (auto const &sub : c.subcharts) {
    if (!g.successors.try_emplace(sub.name).second) {
      throw error("chart " + c.name + ": duplicate subchart " + sub.name);
    }
    g.nodes.push_back(sub.name);
    g.predecessors[sub.name];
  }

  for (auto const &sub : c.subcharts) {
    for (auto const &dep : chart_declared_dependencies(c, sub)) {
      if (!chart_find_subchart(c, dep)) {
        throw error("chart " + c.name + ": subchart " + sub.name +
                    " depends on unknown subchart " + dep);
      }
      g.predecessors[sub.name].insert(dep);
      g.successors[dep].insert(sub.name);
    }
  }

  return g;
}

void dependency_graph_validate(dependency_graph const &g) {
  std::map<std::string, visit_state> state;
  std::vector<std::string> sorted{ g.nodes };
  std::ranges::sort(sorted);

  for (auto const &node : sorted) {
    if (state[node] != visit_state::unvisited) { continue; }
    std::vector<std::string> stack;
    if (auto const cycle{ find_cycle(g, node, state, stack) }) {
      throw cycle_error("dependency cycle detected in chart " + g.owner + ": " +
                        util_join(*cycle, " -> "));
    }
  }
}

install_plan dependency_graph_plan(dependency_graph const &g) {
  dependency_graph_validate(g);

  install_plan plan;
  std::set<std::string> placed;
  std::vector<std::string> remaining;

  for (auto const &node : g.nodes) {
    if (g.is_isolated(node)) {
      plan.with_owner.push_back(node);
    } else {
      remaining.push_back(node);
    }
  }
  std::ranges::sort(plan.with_owner);

  while (!remaining.empty()) {
    std::vector<std::string> tier;
    for (auto const &node : remaining) {
      auto const &preds{ g.predecessors.at(node) };
      if (std::ranges::all_of(preds, [&](auto const &p) { return placed.contains(p); })) {
        tier.push_back(node);
      }
    }
    if (tier.empty()) {
      throw cycle_error("dependency cycle detected in chart " + g.owner + ": " +
                        util_join(remaining, ", "));
    }

    std::ranges::sort(tier);
    for (auto const &node : tier) { placed.insert(node); }
    std::erase_if(remaining, [&](auto const &n) { return placed.contains(n); });
    plan.tiers.push_back(std::move(tier));
  }

  return plan;
}

}  // namespace keel
