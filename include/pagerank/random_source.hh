#ifndef __PAGERANK_RANDOM_SOURCE_HH__
#define __PAGERANK_RANDOM_SOURCE_HH__

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace pagerank {

// Source of weighted random choices for the sampling estimator.
struct RandomSource {
  virtual ~RandomSource() = default;

  // Returns an index into `weights`, picked with probability proportional to
  // its weight.
  virtual size_t ChooseIndex(const std::vector<double> &weights) = 0;
};

class MersenneTwisterSource : public RandomSource {
public:
  explicit MersenneTwisterSource(uint64_t seed) : rng_(seed) {}

  size_t ChooseIndex(const std::vector<double> &weights) override;

private:
  std::mt19937_64 rng_;
};

// 0 means "pick one from the clock".
uint64_t ResolveSeed(uint64_t seed);

} // namespace pagerank

#endif
