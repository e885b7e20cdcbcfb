#ifndef __PAGERANK_REPORT_HH__
#define __PAGERANK_REPORT_HH__

#include "cli.hh"
#include "iterative_estimator.hh"
#include "link_graph.hh"
#include "random_source.hh"
#include <ostream>

namespace pagerank {

// Both estimates for one corpus, reported side by side.
struct RankReport {
  RankResult sampled;
  RankResult iterated;
  IterationStats stats;
};

// Run both estimators over `graph`. With options.parallel the sampler runs on
// its own thread and any exception it throws is rethrown here.
RankReport RankCorpus(const LinkGraph &graph, const Options &options,
                      RandomSource &random);

// Same as above with a MersenneTwisterSource seeded from options.seed.
RankReport RankCorpus(const LinkGraph &graph, const Options &options);

// One "  page: 0.1234" line per page, sorted by page.
void PrintRanks(std::ostream &out, const RankResult &ranks);

void PrintReport(std::ostream &out, const RankReport &report,
                 int64_t sample_count);

// Crawl, rank and print. Returns the process exit status: 0 on success, 1
// if the corpus can't be crawled or an estimator fails.
int RunRanking(const Options &options, RandomSource &random,
               std::ostream &out, std::ostream &err);
int RunRanking(const Options &options, std::ostream &out, std::ostream &err);

} // namespace pagerank

#endif
