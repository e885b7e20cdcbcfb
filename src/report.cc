#include "report.hh"
#include "corpus_crawler.hh"
#include "errors.hh"
#include "rank_utils.hh"
#include "sampling_estimator.hh"

#include <exception>
#include <iomanip>
#include <spdlog/spdlog.h>
#include <thread>

namespace pagerank {

namespace {
void CheckSum(const char *estimator, const RankResult &ranks) {
  if (!IsDistribution(ranks, 1e-6)) {
    spdlog::warn("{} ranks sum to {}", estimator, RankSum(ranks));
  }
}
} // namespace

RankReport RankCorpus(const LinkGraph &graph, const Options &options,
                      RandomSource &random) {
  RankReport report;

  // Only the graph is shared, and neither estimator writes to it.
  if (options.parallel) {
    std::exception_ptr sampler_error;
    std::thread sampler([&]() {
      try {
        report.sampled =
            SamplePagerank(graph, options.damping, options.samples, random);
      } catch (...) {
        sampler_error = std::current_exception();
      }
    });
    try {
      report.iterated = IteratePagerank(graph, options.damping,
                                        options.iteration, &report.stats);
    } catch (...) {
      sampler.join();
      throw;
    }
    sampler.join();
    if (sampler_error) {
      std::rethrow_exception(sampler_error);
    }
  } else {
    report.sampled =
        SamplePagerank(graph, options.damping, options.samples, random);
    report.iterated = IteratePagerank(graph, options.damping,
                                      options.iteration, &report.stats);
  }

  spdlog::info("Iteration converged after {} sweeps (last change {})",
               report.stats.iterations, report.stats.last_change);
  return report;
}

RankReport RankCorpus(const LinkGraph &graph, const Options &options) {
  MersenneTwisterSource random(ResolveSeed(options.seed));
  return RankCorpus(graph, options, random);
}

void PrintRanks(std::ostream &out, const RankResult &ranks) {
  for (const auto &[page, rank] : ranks) {
    out << "  " << page << ": " << std::fixed << std::setprecision(4) << rank
        << "\n";
  }
}

void PrintReport(std::ostream &out, const RankReport &report,
                 int64_t sample_count) {
  out << "PageRank Results from Sampling (n = " << sample_count << ")\n";
  PrintRanks(out, report.sampled);
  out << "PageRank Results from Iteration\n";
  PrintRanks(out, report.iterated);
}

int RunRanking(const Options &options, RandomSource &random,
               std::ostream &out, std::ostream &err) {
  auto graph = CrawlCorpus(options.corpus);
  if (!graph.has_value()) {
    err << "Error: unable to build link graph from " << options.corpus
        << "\n";
    return 1;
  }

  RankReport report;
  try {
    report = RankCorpus(*graph, options, random);
  } catch (const PreconditionError &e) {
    spdlog::error("Invalid input: {}", e.what());
    err << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const ConvergenceError &e) {
    spdlog::error("{}", e.what());
    err << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception &e) {
    spdlog::error("Ranking failed: {}", e.what());
    err << "Error: " << e.what() << std::endl;
    return 1;
  }

  CheckSum("Sampled", report.sampled);
  CheckSum("Iterated", report.iterated);

  PrintReport(out, report, options.samples);
  spdlog::info("Ranking complete");
  return 0;
}

int RunRanking(const Options &options, std::ostream &out, std::ostream &err) {
  MersenneTwisterSource random(ResolveSeed(options.seed));
  return RunRanking(options, random, out, err);
}

} // namespace pagerank
