#include "installer.h"

#include "dependency_graph.h"
#include "errors.h"
#include "trace.h"
#include "tui.h"

#include "tbb/task_group.h"

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>

namespace keel {

namespace {

[[noreturn]] void rethrow_in_tier(std::string const &chart_name,
                                  std::size_t tier,
                                  std::exception_ptr ep) {
  auto const prefix{ "chart " + chart_name + " tier " + std::to_string(tier) + ": " };
  try {
    std::rethrow_exception(ep);
  } catch (cycle_error const &e) {
    throw cycle_error(prefix + e.what());
  } catch (manifest_build_error const &e) {
    throw manifest_build_error(prefix + e.what());
  } catch (apply_error const &e) {
    throw apply_error(prefix + e.what());
  } catch (readiness_error const &e) {
    throw readiness_error(prefix + e.what());
  } catch (std::exception const &e) {
    throw error(prefix + e.what());
  }
}

void validate_tree(chart const &c) {
  dependency_graph_validate(dependency_graph_build(c));
  for (auto const &sub : c.subcharts) { validate_tree(sub); }
}

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

}  // namespace

installer::installer(kube_client &kube, chart_renderer &renderer)
    : kube_{ kube }, renderer_{ renderer } {}

std::string installer::install(chart const &c, install_options const &opts) {
  if (opts.strategy == wait_strategy::ordered) { return install_ordered(c, opts); }
  return install_flat(c, opts);
}

std::string installer::install_ordered(chart const &c, install_options const &opts) {
  validate_tree(c);
  return install_graph(c, opts);
}

std::string installer::install_graph(chart const &c, install_options const &opts) {
  auto const start{ std::chrono::steady_clock::now() };

  auto const graph{ dependency_graph_build(c) };
  auto const plan{ dependency_graph_plan(graph) };
  KEEL_TRACE_GRAPH_BUILT(c.name, graph.nodes.size(), graph.edge_count(), plan.tiers.size() + 1);
  tui::debug("chart %s: %zu subchart(s) in %zu tier(s), %zu installed with the chart",
             c.name.c_str(),
             graph.nodes.size(),
             plan.tiers.size(),
             plan.with_owner.size());

  std::vector<std::string> installed;
  for (std::size_t i{ 0 }; i < plan.tiers.size(); ++i) {
    installed.push_back(install_tier(c, plan.tiers[i], i + 1, false, opts));
  }
  installed.push_back(install_tier(c, plan.with_owner, plan.tiers.size() + 1, true, opts));

  KEEL_TRACE_CHART_INSTALL_COMPLETE(c.name, true, elapsed_ms(start));
  return util_join_manifests(installed);
}

std::string installer::install_tier(chart const &c,
                                    std::vector<std::string> const &names,
                                    std::size_t tier,
                                    bool with_owner,
                                    install_options const &opts) {
  auto const start{ std::chrono::steady_clock::now() };
  KEEL_TRACE_TIER_START(c.name, tier, util_join(names, ","));

  // One slot per sub-unit; each task writes only its own. Nested sub-units
  // create their resources inside their task, ahead of the tier batch.
  std::vector<std::string> nested(names.size());
  std::vector<std::string> pending(names.size());

  std::string batch;
  try {
    tbb::task_group tg;
    for (std::size_t i{ 0 }; i < names.size(); ++i) {
      tg.run([&, i] {
        auto const &sub{ *chart_find_subchart(c, names[i]) };
        if (sub.subcharts.empty()) {
          pending[i] = renderer_.render(sub);
        } else {
          nested[i] = install_graph(sub, opts);
        }
      });
    }
    tg.wait();

    if (with_owner) { pending.push_back(renderer_.render(c)); }

    batch = util_join_manifests(pending);
    if (!batch.empty()) { apply_batch(batch, opts); }
  } catch (std::exception const &) {
    rethrow_in_tier(c.name, tier, std::current_exception());
  }

  KEEL_TRACE_TIER_COMPLETE(c.name, tier, elapsed_ms(start));
  nested.push_back(std::move(batch));
  return util_join_manifests(nested);
}

void installer::apply_batch(std::string const &manifest, install_options const &opts) {
  resource_list resources;
  try {
    resources = kube_.build(manifest, true);
  } catch (std::exception const &e) {
    throw manifest_build_error(std::string{ "unable to build kubernetes objects: " } +
                               e.what());
  }

  try {
    kube_.create(resources,
                 create_options{ .server_side_apply = opts.server_side_apply,
                                 .force_conflicts = false });
  } catch (std::exception const &e) {
    throw apply_error(std::string{ "unable to create resources: " } + e.what());
  }

  if (!opts.wait || opts.strategy == wait_strategy::none) { return; }

  std::unique_ptr<waiter> w;
  try {
    w = kube_.get_waiter(opts.strategy);
  } catch (std::exception const &e) {
    throw error(std::string{ "unable to get waiter: " } + e.what());
  }

  try {
    w->wait(resources, opts.timeout);
  } catch (std::exception const &e) {
    throw readiness_error(std::string{ "resources not ready: " } + e.what());
  }
}

std::string installer::install_flat(chart const &c, install_options const &opts) {
  auto const start{ std::chrono::steady_clock::now() };

  std::vector<std::string> documents;
  collect_flat(c, documents);
  auto const manifest{ util_join_manifests(documents) };

  if (!manifest.empty()) { apply_batch(manifest, opts); }

  KEEL_TRACE_CHART_INSTALL_COMPLETE(c.name, false, elapsed_ms(start));
  return manifest;
}

void installer::collect_flat(chart const &c, std::vector<std::string> &documents) {
  for (auto const &sub : c.subcharts) { collect_flat(sub, documents); }
  documents.push_back(renderer_.render(c));
}

}  // namespace keel
