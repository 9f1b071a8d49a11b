#include "chart.h"

#include "errors.h"

#include <doctest/doctest.h>

#include <filesystem>
#include <fstream>

namespace {

struct temp_chart_file {
  explicit temp_chart_file(std::string const &text)
      : path{ std::filesystem::temp_directory_path() / "keel_chart_tests.yaml" } {
    std::ofstream out{ path };
    out << text;
  }
  ~temp_chart_file() { std::filesystem::remove(path); }

  std::filesystem::path path;
};

keel::chart make_sub(std::string name, std::string depends_on = {}) {
  keel::chart c{ .name = std::move(name) };
  if (!depends_on.empty()) {
    c.annotations[std::string{ keel::kDependsOnAnnotation }] = std::move(depends_on);
  }
  return c;
}

}  // namespace

TEST_CASE("chart_declared_dependencies: comma-separated annotation") {
  keel::chart parent{ .name = "foo" };
  auto const sub{ make_sub("bar", " nginx , rabbitmq,") };
  auto const deps{ keel::chart_declared_dependencies(parent, sub) };
  CHECK(deps == std::vector<std::string>{ "nginx", "rabbitmq" });
}

TEST_CASE("chart_declared_dependencies: YAML list annotation") {
  keel::chart parent{ .name = "foo" };
  auto const sub{ make_sub("bar", "[rabbitmq, nginx]") };
  auto const deps{ keel::chart_declared_dependencies(parent, sub) };
  CHECK(deps == std::vector<std::string>{ "nginx", "rabbitmq" });
}

TEST_CASE("chart_declared_dependencies: nested annotation entries rejected") {
  keel::chart parent{ .name = "foo" };
  auto const sub{ make_sub("bar", "[nginx, {name: redis}]") };
  CHECK_THROWS_AS(keel::chart_declared_dependencies(parent, sub), keel::error);
}

TEST_CASE("chart_declared_dependencies: mapping annotation rejected") {
  keel::chart parent{ .name = "foo" };
  auto const sub{ make_sub("bar", "{nginx: true}") };
  CHECK_THROWS_WITH_AS(keel::chart_declared_dependencies(parent, sub),
                       doctest::Contains("invalid keel.sh/depends-on annotation"),
                       keel::error);
}

TEST_CASE("chart_declared_dependencies: annotation and structured field merge") {
  keel::chart parent{ .name = "foo" };
  parent.dependencies.push_back({ .name = "bar", .depends_on = { "nginx", "redis" } });
  parent.dependencies.push_back({ .name = "other", .depends_on = { "ignored" } });
  auto const sub{ make_sub("bar", "nginx,rabbitmq") };

  auto const deps{ keel::chart_declared_dependencies(parent, sub) };
  CHECK(deps == std::vector<std::string>{ "nginx", "rabbitmq", "redis" });
}

TEST_CASE("chart_declared_dependencies: none declared") {
  keel::chart parent{ .name = "foo" };
  CHECK(keel::chart_declared_dependencies(parent, make_sub("bar")).empty());
}

TEST_CASE("chart_find_subchart") {
  keel::chart parent{ .name = "foo" };
  parent.subcharts.push_back(make_sub("nginx"));
  REQUIRE(keel::chart_find_subchart(parent, "nginx") != nullptr);
  CHECK(keel::chart_find_subchart(parent, "nginx")->name == "nginx");
  CHECK(keel::chart_find_subchart(parent, "redis") == nullptr);
}

TEST_CASE("chart_load: nested description") {
  temp_chart_file const file{ R"(name: foo
version: 1.2.0
dependencies:
  - name: orphaned
    depends-on: []
subcharts:
  - name: nginx
  - name: rabbitmq
  - name: bar
    annotations:
      keel.sh/depends-on: nginx,rabbitmq
    subcharts:
      - name: inner
  - name: orphaned
)" };

  auto const c{ keel::chart_load(file.path) };
  CHECK(c.name == "foo");
  CHECK(c.version == "1.2.0");
  REQUIRE(c.subcharts.size() == 4);
  REQUIRE(c.dependencies.size() == 1);
  CHECK(c.dependencies[0].depends_on.empty());

  auto const *bar{ keel::chart_find_subchart(c, "bar") };
  REQUIRE(bar != nullptr);
  CHECK(bar->subcharts.size() == 1);
  CHECK(keel::chart_declared_dependencies(c, *bar) ==
        std::vector<std::string>{ "nginx", "rabbitmq" });
}

TEST_CASE("chart_load: list-valued annotation") {
  temp_chart_file const file{ R"(name: foo
subcharts:
  - name: a
  - name: b
    annotations:
      keel.sh/depends-on: [a]
)" };
  auto const c{ keel::chart_load(file.path) };
  CHECK(keel::chart_declared_dependencies(c, c.subcharts[1]) ==
        std::vector<std::string>{ "a" });
}

TEST_CASE("chart_load: errors") {
  SUBCASE("missing file") {
    CHECK_THROWS_AS(keel::chart_load("/nonexistent/keel/chart.yaml"), keel::error);
  }

  SUBCASE("missing name") {
    temp_chart_file const file{ "version: 1.0.0\n" };
    CHECK_THROWS_AS(keel::chart_load(file.path), keel::error);
  }

  SUBCASE("subcharts not a list") {
    temp_chart_file const file{ "name: foo\nsubcharts: nope\n" };
    CHECK_THROWS_AS(keel::chart_load(file.path), keel::error);
  }
}
