#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace keel {

// Chart annotation listing sibling sub-units that must be ready first. The value is a
// YAML sequence or a comma-separated string.
inline constexpr std::string_view kDependsOnAnnotation{ "keel.sh/depends-on" };

// Structured dependency declaration on the parent chart.
struct chart_dependency {
  std::string name;
  std::vector<std::string> depends_on;
};

struct chart {
  std::string name;
  std::string version;
  std::map<std::string, std::string> annotations;
  std::vector<chart_dependency> dependencies;
  std::vector<chart> subcharts;
};

// Renders a chart's own resources (not its subcharts) to manifest text. Called
// concurrently for sibling sub-units, so implementations must be thread-safe.
class chart_renderer {
 public:
  virtual ~chart_renderer() = default;
  virtual std::string render(chart const &c) = 0;
};

// Names sub must be installed after: union of sub's depends-on annotation and the
// parent's structured declaration for sub, sorted, without duplicates.
std::vector<std::string> chart_declared_dependencies(chart const &parent, chart const &sub);

chart const *chart_find_subchart(chart const &parent, std::string_view name);

// Load a chart description file. Throws keel::error on unreadable or malformed input.
chart chart_load(std::filesystem::path const &path);

}  // namespace keel
