#ifndef __PAGERANK_ITERATIVE_ESTIMATOR_HH__
#define __PAGERANK_ITERATIVE_ESTIMATOR_HH__

#include "link_graph.hh"
#include <cstddef>

namespace pagerank {

struct IterationOptions {
  // Stop once no rank moves by more than this between two sweeps.
  double tolerance{0.001};
  // Give up with ConvergenceError after this many sweeps.
  size_t max_iterations{10000};
};

struct IterationStats {
  size_t iterations{0};
  double last_change{0.0};
};

/**
 * @brief Compute PageRank by fixed-point iteration
 *
 * @details Starts from the uniform distribution and repeatedly applies
 *   rank'(p) = (1-d)/N + d * sum over i linking to p of rank(i) / |L(i)|
 * where a page without links counts as linking to every page. Every sweep
 * reads only the previous sweep's ranks.
 *
 * Throws PreconditionError on an empty graph, a damping factor outside (0,1)
 * or invalid options, and ConvergenceError if options.max_iterations sweeps
 * are not enough. If `stats` is given it receives the sweep count and the
 * final change.
 */
RankResult IteratePagerank(const LinkGraph &graph, double damping,
                           const IterationOptions &options = {},
                           IterationStats *stats = nullptr);

} // namespace pagerank

#endif
