#ifndef __PAGERANK_SAMPLING_ESTIMATOR_HH__
#define __PAGERANK_SAMPLING_ESTIMATOR_HH__

#include "link_graph.hh"
#include "random_source.hh"
#include <cstdint>

namespace pagerank {

constexpr int64_t kDefaultSampleCount = 10000;

// Estimate PageRank as the visit frequency of a random surfer.
// The walk starts on a uniformly chosen page and takes `sample_count` steps
// through TransitionModel, drawing every step from `random`. Each step counts
// one visit to the page it lands on, so the result sums to exactly one.
// Throws PreconditionError on an empty graph, sample_count <= 0 or a damping
// factor outside (0,1).
RankResult SamplePagerank(const LinkGraph &graph, double damping,
                          int64_t sample_count, RandomSource &random);

// Same as above with a MersenneTwisterSource seeded from `seed`.
RankResult SamplePagerank(const LinkGraph &graph, double damping,
                          int64_t sample_count = kDefaultSampleCount,
                          uint64_t seed = 0);

} // namespace pagerank

#endif
