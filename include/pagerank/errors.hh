#ifndef __PAGERANK_ERRORS_HH__
#define __PAGERANK_ERRORS_HH__

#include <cstddef>
#include <stdexcept>
#include <string>

namespace pagerank {

// Raised when a caller hands the core an argument it must never receive:
// an empty graph, an unknown page, a damping factor outside (0,1), ...
class PreconditionError : public std::invalid_argument {
public:
  explicit PreconditionError(const std::string &what)
      : std::invalid_argument(what) {}
};

// Raised when the iterative estimator hits its iteration cap before the
// ranks settle within tolerance.
class ConvergenceError : public std::runtime_error {
public:
  ConvergenceError(size_t iterations, double last_change);

  size_t Iterations() const { return iterations_; }
  double LastChange() const { return last_change_; }

private:
  size_t iterations_;
  double last_change_;
};

// Throws PreconditionError unless 0 < damping < 1.
void CheckDamping(double damping);

} // namespace pagerank

#endif
