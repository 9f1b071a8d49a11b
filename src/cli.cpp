#include "cli.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keel {

namespace {

// "stderr", "file:<path>", comma-separated. Empty means stderr.
std::optional<std::vector<tui::trace_output_spec>> parse_trace_outputs(
    std::string_view value,
    std::string &bad_token) {
  std::vector<tui::trace_output_spec> outputs;
  if (value.empty()) {
    outputs.push_back({ .type = tui::trace_output_type::std_err });
    return outputs;
  }

  while (!value.empty()) {
    auto const comma{ value.find(',') };
    auto const token{ value.substr(0, comma) };
    value = comma == std::string_view::npos ? std::string_view{} : value.substr(comma + 1);
    if (token.empty()) { continue; }

    constexpr std::string_view kFilePrefix{ "file:" };
    if (token == "stderr") {
      outputs.push_back({ .type = tui::trace_output_type::std_err });
    } else if (token.starts_with(kFilePrefix) && token.size() > kFilePrefix.size()) {
      outputs.push_back({ .type = tui::trace_output_type::file,
                          .file_path = std::filesystem::path{
                              token.substr(kFilePrefix.size()) } });
    } else {
      bad_token = token;
      return std::nullopt;
    }
  }
  return outputs;
}

}  // namespace

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "keel - dependency-ordered chart installer" };

  bool verbose{ false };
  app.add_flag("--verbose", verbose, "Debug logging with timestamp and level prefixes");

  std::string trace_value;
  auto *trace_opt{ app.add_option(
      "--trace",
      trace_value,
      "Emit trace events: 'stderr' and/or 'file:<path>' (JSON lines), comma-separated") };
  trace_opt->expected(0, 1);

  bool show_version{ false };
  app.add_flag("-v,--version", show_version, "Same as the version subcommand");

  std::optional<cli_args::cmd_cfg_t> selected;
  auto const on_selected{ [&selected](auto cfg) { selected = std::move(cfg); } };
  cmd_version::register_cli(app, on_selected);
  cmd_plan::register_cli(app, on_selected);

  cli_args args{ .verbosity = tui::level::TUI_INFO };

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = e.what(); }

  if (trace_opt->count() > 0) {
    std::string bad_token;
    auto outputs{ parse_trace_outputs(trace_value, bad_token) };
    if (!outputs) {
      args.cli_output = "Invalid trace output spec: " + bad_token;
      return args;
    }
    args.trace_outputs = std::move(*outputs);
  }

  if (verbose || !args.trace_outputs.empty()) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  }

  if (!args.cli_output.empty()) { return args; }

  if (show_version) {
    args.cmd_cfg = cmd_version::cfg{};
  } else if (selected) {
    args.cmd_cfg = std::move(selected);
  } else {
    args.cli_output = app.help();
  }
  return args;
}

}  // namespace keel
