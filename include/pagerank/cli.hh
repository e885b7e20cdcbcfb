#ifndef __PAGERANK_CLI_HH__
#define __PAGERANK_CLI_HH__
#include "CLI/App.hpp"
#include "iterative_estimator.hh"
#include "sampling_estimator.hh"
#include "spdlog/common.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace pagerank {

struct Options {
  std::string corpus;
  double damping{0.85};
  int64_t samples{kDefaultSampleCount};
  IterationOptions iteration;
  uint64_t seed{0};
  bool parallel{false};
  bool verbose{false};
  std::string log_file;
  spdlog::level::level_enum log_level{spdlog::level::info};
};

void CreateCli(CLI::App &app, Options &options);
void SetupLogging(const Options &options);

} // namespace pagerank
#endif
