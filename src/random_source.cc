#include "random_source.hh"
#include "errors.hh"

#include <chrono>

namespace pagerank {

size_t MersenneTwisterSource::ChooseIndex(const std::vector<double> &weights) {
  if (weights.empty()) {
    throw PreconditionError("Cannot choose from an empty set of weights");
  }
  std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
  return dist(rng_);
}

uint64_t ResolveSeed(uint64_t seed) {
  if (seed != 0) {
    return seed;
  }
  return static_cast<uint64_t>(
      std::chrono::system_clock::now().time_since_epoch().count());
}

} // namespace pagerank
