#include "cmd_plan.h"

#include "dependency_graph.h"
#include "tui.h"
#include "util.h"

#include <CLI/CLI.hpp>

#include <memory>

namespace keel {

namespace {

void render_tiers(chart const &c, std::size_t depth, std::string &out) {
  std::string const indent(depth * 2, ' ');
  auto const plan{ dependency_graph_plan(dependency_graph_build(c)) };

  out += indent + c.name + "\n";

  auto const emit{ [&](std::size_t tier, std::vector<std::string> names, bool with_owner) {
    std::vector<std::string> nested;
    for (auto const &name : names) {
      if (!chart_find_subchart(c, name)->subcharts.empty()) { nested.push_back(name); }
    }
    if (with_owner) { names.push_back("(" + c.name + ")"); }

    out += indent + "  tier " + std::to_string(tier) + ": " + util_join(names, ", ") + "\n";
    for (auto const &name : nested) {
      render_tiers(*chart_find_subchart(c, name), depth + 2, out);
    }
  } };

  for (std::size_t i{ 0 }; i < plan.tiers.size(); ++i) {
    emit(i + 1, plan.tiers[i], false);
  }
  emit(plan.tiers.size() + 1, plan.with_owner, true);
}

void collect_flat(chart const &c, std::vector<std::string> &names) {
  for (auto const &sub : c.subcharts) { collect_flat(sub, names); }
  names.push_back(c.name);
}

}  // namespace

void cmd_plan::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("plan", "Print the installation order of a chart") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  auto strategy_ptr{ std::make_shared<std::string>(
      wait_strategy_name(wait_strategy::ordered)) };

  sub->add_option("chart", cfg_ptr->chart_path, "Chart description file (YAML)")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_option("--wait", *strategy_ptr, "Wait strategy: none, legacy or ordered")
      ->check(CLI::Validator(
          [](std::string &value) -> std::string {
            if (wait_strategy_parse(value)) { return {}; }
            return "unknown wait strategy: " + value;
          },
          "STRATEGY"));

  sub->callback([cfg_ptr, strategy_ptr, on_selected = std::move(on_selected)] {
    cfg_ptr->strategy = *wait_strategy_parse(*strategy_ptr);
    on_selected(*cfg_ptr);
  });
}

cmd_plan::cmd_plan(cmd_plan::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_plan::execute() {
  auto const c{ chart_load(cfg_.chart_path) };
  auto const text{ cmd_plan_render(c, cfg_.strategy) };
  tui::print_stdout("%s", text.c_str());
}

std::string cmd_plan_render(chart const &c, wait_strategy strategy) {
  std::string out;
  if (strategy == wait_strategy::ordered) {
    render_tiers(c, 0, out);
    return out;
  }

  std::vector<std::string> names;
  collect_flat(c, names);
  out += c.name + "\n  batch: " + util_join(names, ", ") + "\n";
  return out;
}

}  // namespace keel
