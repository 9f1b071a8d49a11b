#include "tui.h"

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

TEST_CASE("tui init can only run once") {
  CHECK_THROWS_AS(keel::tui::init(), std::logic_error);
}

TEST_CASE("tui allows handler changes while idle") {
  CHECK_NOTHROW(keel::tui::set_output_handler([](std::string_view) {}));
  CHECK_NOTHROW(keel::tui::set_output_handler([](std::string_view) {}));
}

TEST_CASE("tui enforces run/shutdown sequencing") {
  auto handler{ [](std::string_view) {} };
  CHECK_NOTHROW(keel::tui::set_output_handler(handler));
  CHECK_NOTHROW(keel::tui::run(keel::tui::level::TUI_INFO));
  CHECK_NOTHROW(keel::tui::shutdown());

  CHECK_NOTHROW(keel::tui::run(std::nullopt));
  CHECK_THROWS_AS(keel::tui::set_output_handler(handler), std::logic_error);
  CHECK_THROWS_AS(keel::tui::run(std::nullopt), std::logic_error);
  CHECK_THROWS_AS(keel::tui::configure_trace_outputs({}), std::logic_error);

  CHECK_NOTHROW(keel::tui::shutdown());
  CHECK_THROWS_AS(keel::tui::shutdown(), std::logic_error);

  CHECK_NOTHROW(keel::tui::set_output_handler(handler));
}

namespace {

struct captured_output {
  std::vector<std::string> messages;

  captured_output() {
    // Drop anything queued by earlier tests before capturing.
    keel::tui::set_output_handler([](std::string_view) {});
    keel::tui::run(std::nullopt);
    keel::tui::shutdown();

    keel::tui::set_output_handler(
        [this](std::string_view value) { messages.emplace_back(value); });
  }

  ~captured_output() {
    try {
      keel::tui::set_output_handler([](std::string_view) {});
    } catch (std::logic_error const &error) {
      FAIL("set_output_handler should not throw during teardown: " << error.what());
    }
  }
};

}  // namespace

TEST_CASE_FIXTURE(captured_output, "tui unstructured logs are raw messages") {
  REQUIRE(messages.empty());

  CHECK_NOTHROW(keel::tui::run(std::nullopt));

  keel::tui::debug("hello %s", "world");
  keel::tui::info("value %d", 42);
  keel::tui::warn("three %d", 3);
  keel::tui::error("boom");

  CHECK_NOTHROW(keel::tui::shutdown());

  REQUIRE(messages.size() == 4);
  CHECK(messages[0] == "hello world\n");
  CHECK(messages[1] == "value 42\n");
  CHECK(messages[2] == "three 3\n");
  CHECK(messages[3] == "boom\n");
}

TEST_CASE_FIXTURE(captured_output, "tui structured logs include prefix") {
  CHECK_NOTHROW(keel::tui::run(keel::tui::level::TUI_DEBUG, true));
  keel::tui::info("structured %d", 7);
  CHECK_NOTHROW(keel::tui::shutdown());

  REQUIRE(messages.size() == 1);
  auto const &line{ messages[0] };
  CHECK(line.starts_with("["));
  CHECK(line.find("] [INF] ") != std::string::npos);
  CHECK(line.ends_with("structured 7\n"));
}

TEST_CASE_FIXTURE(captured_output, "tui severity filtering honors threshold") {
  CHECK_NOTHROW(keel::tui::run(keel::tui::level::TUI_WARN, true));
  keel::tui::debug("debug");
  keel::tui::info("info");
  keel::tui::warn("warn");
  keel::tui::error("error");
  CHECK_NOTHROW(keel::tui::shutdown());

  REQUIRE(messages.size() == 2);
  CHECK(messages[0].find("WRN") != std::string::npos);
  CHECK(messages[0].find("warn") != std::string::npos);
  CHECK(messages[1].find("ERR") != std::string::npos);
  CHECK(messages[1].find("error") != std::string::npos);
}

TEST_CASE_FIXTURE(captured_output, "tui long messages are not truncated") {
  std::string const long_text(4000, 'x');
  CHECK_NOTHROW(keel::tui::run(std::nullopt));
  keel::tui::info("%s", long_text.c_str());
  CHECK_NOTHROW(keel::tui::shutdown());

  REQUIRE(messages.size() == 1);
  CHECK(messages[0] == long_text + "\n");
}

TEST_CASE_FIXTURE(captured_output, "tui trace events reach handler") {
  keel::tui::configure_trace_outputs(
      { { keel::tui::trace_output_type::std_err, std::nullopt } });
  CHECK(keel::tui::g_trace_enabled);
  CHECK_NOTHROW(keel::tui::run(keel::tui::level::TUI_DEBUG, false));

  KEEL_TRACE_TIER_START(std::string{ "foo" }, 2, std::string{ "bar" });

  CHECK_NOTHROW(keel::tui::shutdown());
  CHECK_FALSE(keel::tui::g_trace_enabled);
  REQUIRE(messages.size() == 1);
  CHECK(messages[0].find("tier_start") != std::string::npos);
  CHECK(messages[0].find("chart=foo") != std::string::npos);
  CHECK(messages[0].find("tier=2") != std::string::npos);

  keel::tui::configure_trace_outputs({});
}

TEST_CASE_FIXTURE(captured_output, "tui trace lines carry no log decoration") {
  keel::tui::configure_trace_outputs(
      { { keel::tui::trace_output_type::std_err, std::nullopt } });
  CHECK_NOTHROW(keel::tui::run(keel::tui::level::TUI_DEBUG, true));

  KEEL_TRACE_TIER_COMPLETE(std::string{ "foo" }, 1, 5);
  keel::tui::info("done");

  CHECK_NOTHROW(keel::tui::shutdown());
  REQUIRE(messages.size() == 2);
  CHECK(messages[0].starts_with("tier_complete"));
  CHECK(messages[1].find("] [INF] done") != std::string::npos);

  keel::tui::configure_trace_outputs({});
}

TEST_CASE_FIXTURE(captured_output, "tui trace events written to file as json lines") {
  auto const path{ std::filesystem::temp_directory_path() / "keel_tui_trace.jsonl" };
  keel::tui::configure_trace_outputs(
      { { keel::tui::trace_output_type::file, path } });
  CHECK_NOTHROW(keel::tui::run(keel::tui::level::TUI_DEBUG, false));

  KEEL_TRACE_HOOK_DELETED(std::string{ "templates/a.yaml" },
                          std::string_view{ "hook-succeeded" },
                          std::string{ "Job" });

  CHECK_NOTHROW(keel::tui::shutdown());
  CHECK(messages.empty());

  std::ifstream in{ path };
  std::string line;
  REQUIRE(std::getline(in, line));
  CHECK(line.find("\"event\":\"hook_deleted\"") != std::string::npos);
  CHECK(line.find("\"policy\":\"hook-succeeded\"") != std::string::npos);
  in.close();
  std::filesystem::remove(path);

  keel::tui::configure_trace_outputs({});
}

TEST_CASE("tui traces are dropped when tracing is off") {
  CHECK_FALSE(keel::tui::g_trace_enabled);
  CHECK_NOTHROW(keel::tui::trace(keel::trace_events::graph_built{
      .chart = "foo", .node_count = 1, .edge_count = 0, .tier_count = 1 }));
}
