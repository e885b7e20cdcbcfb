#include "cli.hh"
#include "report.hh"
#include <CLI/CLI.hpp>
#include <iostream>

int main(int argc, char *argv[]) {
  using namespace pagerank;

  CLI::App app{"PageRank - ranks a corpus of HTML pages by sampling and "
               "iteration"};
  Options opts;
  CreateCli(app, opts);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  SetupLogging(opts);

  return RunRanking(opts, std::cout, std::cerr);
}
