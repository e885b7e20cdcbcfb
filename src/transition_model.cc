#include "transition_model.hh"
#include "errors.hh"

#include <spdlog/fmt/fmt.h>

namespace pagerank {

std::vector<double> TransitionWeights(const LinkGraph &graph, size_t index,
                                      double damping) {
  CheckDamping(damping);
  if (index >= graph.Size()) {
    throw PreconditionError(fmt::format(
        "Page index {} out of range for graph of {} pages", index,
        graph.Size()));
  }

  const auto num_pages = static_cast<double>(graph.Size());
  const auto &links = graph.OutLinks(index);

  if (links.empty()) {
    return std::vector<double>(graph.Size(), 1.0 / num_pages);
  }

  const double teleport = (1.0 - damping) / num_pages;
  std::vector<double> weights(graph.Size(), teleport);
  const double follow = damping / static_cast<double>(links.size());
  for (size_t target : links) {
    weights[target] += follow;
  }
  return weights;
}

ProbabilityDistribution TransitionModel(const LinkGraph &graph,
                                        const Page &page, double damping) {
  auto weights = TransitionWeights(graph, graph.IndexOf(page), damping);

  ProbabilityDistribution distribution;
  const auto &pages = graph.Pages();
  for (size_t i = 0; i < pages.size(); ++i) {
    distribution.emplace(pages[i], weights[i]);
  }
  return distribution;
}

} // namespace pagerank
