#ifndef __PAGERANK_TRANSITION_MODEL_HH__
#define __PAGERANK_TRANSITION_MODEL_HH__

#include "link_graph.hh"
#include <vector>

namespace pagerank {

// Distribution over the next page for a random surfer sitting on `page`.
// With probability `damping` the surfer follows one of the page's links,
// otherwise it jumps to any page of the corpus. A page without links jumps
// uniformly.
// Throws PreconditionError if `page` is unknown or damping is not in (0,1).
ProbabilityDistribution TransitionModel(const LinkGraph &graph,
                                        const Page &page, double damping);

// Same distribution as TransitionModel, indexed like graph.Pages().
std::vector<double> TransitionWeights(const LinkGraph &graph, size_t index,
                                      double damping);

} // namespace pagerank

#endif
