#include "chart.h"

#include "errors.h"
#include "util.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <set>

namespace keel {

namespace {

std::vector<std::string> parse_depends_on_annotation(std::string const &value) {
  std::vector<std::string> result;

  YAML::Node node;
  try {
    node = YAML::Load(value);
  } catch (YAML::Exception const &) {
    node = YAML::Node{ value };  // not YAML; treat as a plain comma-separated string
  }

  if (node.IsSequence()) {
    for (auto const &entry : node) {
      if (!entry.IsScalar()) {
        throw error("invalid " + std::string{ kDependsOnAnnotation } +
                    " annotation: entries must be names");
      }
      auto const text{ entry.as<std::string>() };
      if (auto const name{ util_trim(text) }; !name.empty()) { result.emplace_back(name); }
    }
    return result;
  }

  if (node.IsNull()) { return result; }
  if (!node.IsScalar()) {
    throw error("invalid " + std::string{ kDependsOnAnnotation } +
                " annotation: expected a name list or comma-separated names");
  }

  std::string_view rest{ node.Scalar() };
  while (!rest.empty()) {
    auto const comma{ rest.find(',') };
    auto const name{ util_trim(rest.substr(0, comma)) };
    if (!name.empty()) { result.emplace_back(name); }
    if (comma == std::string_view::npos) { break; }
    rest.remove_prefix(comma + 1);
  }
  return result;
}

std::vector<std::string> parse_string_list(YAML::Node const &node, std::string_view what) {
  std::vector<std::string> result;
  if (!node) { return result; }
  if (node.IsScalar()) {
    result.push_back(node.as<std::string>());
    return result;
  }
  if (!node.IsSequence()) {
    throw error("chart: '" + std::string{ what } + "' must be a string or a list");
  }
  for (auto const &entry : node) { result.push_back(entry.as<std::string>()); }
  return result;
}

chart parse_chart(YAML::Node const &node, std::string const &where) {
  if (!node.IsMap()) { throw error(where + ": chart must be a mapping"); }

  chart c;
  if (auto const name{ node["name"] }; name && name.IsScalar()) {
    c.name = name.as<std::string>();
  } else {
    throw error(where + ": chart is missing 'name'");
  }

  if (auto const version{ node["version"] }) { c.version = version.as<std::string>(); }

  if (auto const annotations{ node["annotations"] }) {
    if (!annotations.IsMap()) { throw error(where + ": 'annotations' must be a mapping"); }
    for (auto const &kv : annotations) {
      auto const &value{ kv.second };
      // Non-scalar values are kept as YAML text and parsed again on use.
      c.annotations[kv.first.as<std::string>()] =
          value.IsScalar() ? value.as<std::string>() : YAML::Dump(value);
    }
  }

  if (auto const deps{ node["dependencies"] }) {
    if (!deps.IsSequence()) { throw error(where + ": 'dependencies' must be a list"); }
    for (auto const &dep : deps) {
      if (!dep["name"]) { throw error(where + ": dependency is missing 'name'"); }
      c.dependencies.push_back(chart_dependency{
          .name = dep["name"].as<std::string>(),
          .depends_on = parse_string_list(dep["depends-on"], "depends-on"),
      });
    }
  }

  if (auto const subcharts{ node["subcharts"] }) {
    if (!subcharts.IsSequence()) { throw error(where + ": 'subcharts' must be a list"); }
    for (auto const &sub : subcharts) {
      c.subcharts.push_back(parse_chart(sub, where + "/" + c.name));
    }
  }

  return c;
}

}  // namespace

std::vector<std::string> chart_declared_dependencies(chart const &parent, chart const &sub) {
  std::set<std::string> names;

  if (auto const it{ sub.annotations.find(std::string{ kDependsOnAnnotation }) };
      it != sub.annotations.end()) {
    for (auto &name : parse_depends_on_annotation(it->second)) {
      names.insert(std::move(name));
    }
  }

  for (auto const &dep : parent.dependencies) {
    if (dep.name != sub.name) { continue; }
    for (auto const &name : dep.depends_on) {
      auto const trimmed{ util_trim(name) };
      if (!trimmed.empty()) { names.emplace(trimmed); }
    }
  }

  return { names.begin(), names.end() };
}

chart const *chart_find_subchart(chart const &parent, std::string_view name) {
  auto const it{ std::ranges::find(parent.subcharts, name, &chart::name) };
  return it == parent.subcharts.end() ? nullptr : &*it;
}

chart chart_load(std::filesystem::path const &path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (YAML::Exception const &e) {
    throw error("failed to load chart " + path.string() + ": " + e.what());
  }

  try {
    return parse_chart(root, path.string());
  } catch (YAML::Exception const &e) {
    throw error("failed to parse chart " + path.string() + ": " + e.what());
  }
}

}  // namespace keel
