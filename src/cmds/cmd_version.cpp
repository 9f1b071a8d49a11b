#include "cmd_version.h"

#include "tui.h"

#include <CLI/CLI.hpp>
#include <oneapi/tbb/version.h>

#include <memory>

#ifndef KEEL_VERSION_STR
#error "KEEL_VERSION_STR must be defined by the build system"
#endif

#ifndef KEEL_YAML_CPP_VERSION
#error "KEEL_YAML_CPP_VERSION must be defined by the build system"
#endif

namespace keel {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ std::move(cfg) } {}

void cmd_version::execute() {
  tui::info("keel version %s", KEEL_VERSION_STR);
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  oneTBB: %s", TBB_runtime_version());
  tui::info("  yaml-cpp: %s", KEEL_YAML_CPP_VERSION);
  tui::info("  CLI11: %s", CLI11_VERSION);
}

}  // namespace keel
