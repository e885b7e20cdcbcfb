#include "rank_utils.hh"
#include "errors.hh"

#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace pagerank {

double RankSum(const RankResult &ranks) {
  double sum = 0.0;
  for (const auto &[page, rank] : ranks) {
    (void)page;
    sum += rank;
  }
  return sum;
}

RankResult Normalize(const RankResult &ranks) {
  const double sum = RankSum(ranks);
  if (!(sum > 0.0)) {
    throw PreconditionError(
        fmt::format("Cannot normalize ranks summing to {}", sum));
  }

  RankResult normalized;
  for (const auto &[page, rank] : ranks) {
    normalized.emplace(page, rank / sum);
  }
  return normalized;
}

bool IsDistribution(const RankResult &ranks, double tolerance) {
  for (const auto &[page, rank] : ranks) {
    (void)page;
    if (rank < 0.0) {
      return false;
    }
  }
  return std::abs(RankSum(ranks) - 1.0) <= tolerance;
}

} // namespace pagerank
