#pragma once

#include "chart.h"
#include "cmd.h"
#include "wait_strategy.h"

#include <filesystem>
#include <functional>
#include <string>

namespace CLI { class App; }

namespace keel {

// Prints the order in which a chart's subcharts would be installed.
class cmd_plan : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_plan> {
    std::filesystem::path chart_path;
    wait_strategy strategy{ wait_strategy::ordered };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_plan(cfg cfg);

  void execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

// Tiers per chart, recursively, for the ordered strategy; one flat batch otherwise.
// Throws cycle_error or keel::error for invalid dependency declarations.
std::string cmd_plan_render(chart const &c, wait_strategy strategy);

}  // namespace keel
