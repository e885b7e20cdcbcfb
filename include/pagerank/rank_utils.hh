#ifndef __PAGERANK_RANK_UTILS_HH__
#define __PAGERANK_RANK_UTILS_HH__

#include "link_graph.hh"

namespace pagerank {

double RankSum(const RankResult &ranks);

// Rescale so the values sum to one. Throws PreconditionError if the sum is
// not positive.
RankResult Normalize(const RankResult &ranks);

// True when no value is negative and the values sum to 1 within `tolerance`.
bool IsDistribution(const RankResult &ranks, double tolerance = 1e-9);

} // namespace pagerank

#endif
