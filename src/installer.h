#pragma once

#include "chart.h"
#include "kube_client.h"
#include "util.h"
#include "wait_strategy.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace keel {

struct install_options {
  wait_strategy strategy{ wait_strategy::legacy };
  bool wait{ true };
  std::chrono::seconds timeout{ 300 };
  bool server_side_apply{ false };
};

// Installs a chart and its subcharts. Both paths return the manifest documents that
// were submitted, in submission order, for storage in the release.
class installer : unmovable {
 public:
  installer(kube_client &kube, chart_renderer &renderer);

  // Ordered strategy goes through install_ordered, anything else through install_flat.
  std::string install(chart const &c, install_options const &opts);

  // Tier by tier. Sub-units of one tier are installed concurrently; a tier must be
  // ready before the next starts. Every dependency graph in the tree is validated
  // before the first resource is created. Failures are rethrown as the same error
  // kind, prefixed with chart name and 1-based tier index.
  std::string install_ordered(chart const &c, install_options const &opts);

  // One creation call for the whole tree, subcharts depth-first then the chart's own
  // resources, followed by at most one wait.
  std::string install_flat(chart const &c, install_options const &opts);

 private:
  std::string install_graph(chart const &c, install_options const &opts);
  std::string install_tier(chart const &c,
                           std::vector<std::string> const &names,
                           std::size_t tier,
                           bool with_owner,
                           install_options const &opts);
  void apply_batch(std::string const &manifest, install_options const &opts);
  void collect_flat(chart const &c, std::vector<std::string> &documents);

  kube_client &kube_;
  chart_renderer &renderer_;
};

}  // namespace keel
