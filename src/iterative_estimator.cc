#include "iterative_estimator.hh"
#include "errors.hh"
#include "rank_utils.hh"

#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace pagerank {

namespace {

// One sweep from `rank` into `next_rank`. Returns the largest change.
double RunIteration(const LinkGraph &graph, double damping,
                    const std::vector<double> &rank,
                    std::vector<double> &next_rank) {
  const size_t num_pages = graph.Size();
  const auto n = static_cast<double>(num_pages);

  // Dangling pages spread their rank over the whole corpus.
  double dangling_rank = 0.0;
  for (size_t i = 0; i < num_pages; ++i) {
    if (graph.IsDangling(i)) {
      dangling_rank += rank[i];
    }
  }

  const double base = (1.0 - damping) / n + damping * dangling_rank / n;
  std::fill(next_rank.begin(), next_rank.end(), base);

  for (size_t i = 0; i < num_pages; ++i) {
    const auto &links = graph.OutLinks(i);
    if (!links.empty()) {
      double out_rank = damping * rank[i] / static_cast<double>(links.size());
      for (size_t target : links) {
        next_rank[target] += out_rank;
      }
    }
  }

  double max_diff = 0.0;
  for (size_t i = 0; i < num_pages; ++i) {
    max_diff = std::max(max_diff, std::abs(next_rank[i] - rank[i]));
  }
  return max_diff;
}

} // namespace

RankResult IteratePagerank(const LinkGraph &graph, double damping,
                           const IterationOptions &options,
                           IterationStats *stats) {
  if (graph.Empty()) {
    throw PreconditionError("Cannot iterate PageRank of an empty graph");
  }
  CheckDamping(damping);
  if (!(options.tolerance > 0.0)) {
    throw PreconditionError(
        fmt::format("Tolerance must be positive, got {}", options.tolerance));
  }
  if (options.max_iterations == 0) {
    throw PreconditionError("Iteration cap must be at least 1");
  }

  const size_t num_pages = graph.Size();
  std::vector<double> rank(num_pages, 1.0 / static_cast<double>(num_pages));
  std::vector<double> next_rank(num_pages, 0.0);

  size_t iterations = 0;
  double diff = 0.0;
  do {
    if (iterations == options.max_iterations) {
      spdlog::debug("PageRank gave up after {} iterations, change {}",
                    iterations, diff);
      throw ConvergenceError(iterations, diff);
    }
    diff = RunIteration(graph, damping, rank, next_rank);
    rank.swap(next_rank);
    ++iterations;
  } while (diff > options.tolerance);

  if (stats != nullptr) {
    stats->iterations = iterations;
    stats->last_change = diff;
  }
  spdlog::debug("PageRank converged after {} iterations, change {}",
                iterations, diff);

  RankResult ranks;
  const auto &pages = graph.Pages();
  for (size_t i = 0; i < num_pages; ++i) {
    ranks.emplace(pages[i], rank[i]);
  }
  // Removes floating-point drift accumulated over the sweeps.
  return Normalize(ranks);
}

} // namespace pagerank
