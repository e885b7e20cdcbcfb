#include "sampling_estimator.hh"
#include "errors.hh"
#include "transition_model.hh"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace pagerank {

namespace {
size_t Draw(RandomSource &random, const std::vector<double> &weights) {
  size_t index = random.ChooseIndex(weights);
  if (index >= weights.size()) {
    throw std::out_of_range(fmt::format(
        "Random source returned index {} for {} choices", index,
        weights.size()));
  }
  return index;
}
} // namespace

RankResult SamplePagerank(const LinkGraph &graph, double damping,
                          int64_t sample_count, RandomSource &random) {
  if (graph.Empty()) {
    throw PreconditionError("Cannot sample PageRank of an empty graph");
  }
  if (sample_count <= 0) {
    throw PreconditionError(
        fmt::format("Sample count must be positive, got {}", sample_count));
  }
  CheckDamping(damping);

  const size_t num_pages = graph.Size();
  std::vector<int64_t> visits(num_pages, 0);

  const std::vector<double> uniform(num_pages,
                                    1.0 / static_cast<double>(num_pages));
  size_t current = Draw(random, uniform);
  spdlog::debug("Sampling {} steps from '{}'", sample_count,
                graph.Pages()[current]);

  for (int64_t step = 0; step < sample_count; ++step) {
    current = Draw(random, TransitionWeights(graph, current, damping));
    ++visits[current];
  }

  RankResult ranks;
  const auto &pages = graph.Pages();
  for (size_t i = 0; i < num_pages; ++i) {
    ranks.emplace(pages[i], static_cast<double>(visits[i]) /
                                static_cast<double>(sample_count));
  }
  return ranks;
}

RankResult SamplePagerank(const LinkGraph &graph, double damping,
                          int64_t sample_count, uint64_t seed) {
  MersenneTwisterSource random(ResolveSeed(seed));
  return SamplePagerank(graph, damping, sample_count, random);
}

} // namespace pagerank
