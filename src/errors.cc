#include "errors.hh"

#include <spdlog/fmt/fmt.h>

namespace pagerank {

ConvergenceError::ConvergenceError(size_t iterations, double last_change)
    : std::runtime_error(fmt::format(
          "PageRank did not converge after {} iterations (last change {})",
          iterations, last_change)),
      iterations_(iterations), last_change_(last_change) {}

void CheckDamping(double damping) {
  if (!(damping > 0.0 && damping < 1.0)) {
    throw PreconditionError(
        fmt::format("Damping factor must be in (0, 1), got {}", damping));
  }
}

} // namespace pagerank
