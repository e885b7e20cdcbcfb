#include "cli.hh"
#include "CLI/CLI.hpp"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace pagerank {
namespace {
// Like CLI::Range(0.0, 1.0) but with both ends excluded.
CLI::Validator OpenUnitInterval() {
  return CLI::Validator(
      [](std::string &input) -> std::string {
        double value = 0.0;
        if (!CLI::detail::lexical_cast(input, value)) {
          return "Value " + input + " could not be converted";
        }
        if (!(value > 0.0 && value < 1.0)) {
          return "Value " + input + " not in range (0, 1)";
        }
        return std::string{};
      },
      "FLOAT in (0 - 1)", "OPEN_UNIT_INTERVAL");
}
} // namespace

void SetupLogging(const Options &options) {
  try {
    std::vector<spdlog::sink_ptr> sinks;

    // File sink is always enabled
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.log_file, true);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    sinks.push_back(file_sink);

    // Console sink only if verbose mode is enabled
    if (options.verbose) {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_pattern("[%^%l%$] %v");
      sinks.push_back(console_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("pagerank", sinks.begin(),
                                                   sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(options.log_level);

    spdlog::info("Ranking corpus {} (damping {}, {} samples, tolerance {})",
                 options.corpus, options.damping, options.samples,
                 options.iteration.tolerance);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    exit(1);
  }
}

void CreateCli(CLI::App &app, Options &options) {
  app.add_option("corpus", options.corpus, "Directory of HTML pages to rank")
      ->check(CLI::ExistingDirectory)
      ->required();

  app.add_option("-d,--damping", options.damping,
                 "Probability of following a link (0.0-1.0, exclusive)")
      ->default_val(0.85)
      ->check(OpenUnitInterval());

  app.add_option("-n,--samples", options.samples,
                 "Number of random surfer steps")
      ->default_val(kDefaultSampleCount)
      ->check(CLI::PositiveNumber);

  app.add_option("--tolerance", options.iteration.tolerance,
                 "Convergence threshold for the iterative estimator")
      ->default_val(0.001)
      ->check(CLI::PositiveNumber);

  app.add_option("--max-iterations", options.iteration.max_iterations,
                 "Iteration cap for the iterative estimator")
      ->default_val(10000)
      ->check(CLI::PositiveNumber);

  app.add_option("--seed", options.seed,
                 "RNG seed for sampling (0 for random)")
      ->default_val(0);

  app.add_flag("--parallel", options.parallel,
               "Run both estimators on separate threads");

  app.add_flag("-v,--verbose", options.verbose,
               "Enable verbose console output");
  app.add_option("-l,--log-file", options.log_file, "Log file path")
      ->default_val("pagerank.log");

  app.add_option("--log-level", options.log_level,
                 "Log level (trace, debug, info, warn, error, critical)")
      ->default_val(spdlog::level::info)
      ->transform(CLI::CheckedTransformer(
          std::map<std::string, spdlog::level::level_enum>{
              {"trace", spdlog::level::trace},
              {"debug", spdlog::level::debug},
              {"info", spdlog::level::info},
              {"warn", spdlog::level::warn},
              {"error", spdlog::level::err},
              {"critical", spdlog::level::critical}},
          CLI::ignore_case));
}

} // namespace pagerank
