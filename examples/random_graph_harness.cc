#include "iterative_estimator.hh"
#include "sampling_estimator.hh"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <utility>
#include <vector>

void print_usage(const char *program_name) {
  std::cerr << "Usage: " << program_name
            << " <random_seed> [num_pages] [edge_probability] [samples]\n";
  std::cerr << "  random_seed: Unsigned integer for RNG initialization\n";
}

// Random corpus where each ordered pair of distinct pages is linked with
// probability `edge_probability`.
pagerank::LinkGraph GenerateRandomGraph(std::mt19937_64 &rng,
                                        size_t num_pages,
                                        double edge_probability) {
  std::uniform_real_distribution<> dist(0.0, 1.0);

  std::vector<std::string> names;
  names.reserve(num_pages);
  for (size_t i = 0; i < num_pages; ++i) {
    names.push_back(std::to_string(i) + ".html");
  }

  pagerank::Adjacency links;
  for (const auto &page : names) {
    auto &targets = links[page];
    for (const auto &target : names) {
      if (page != target && dist(rng) < edge_probability) {
        targets.insert(target);
      }
    }
  }
  return pagerank::LinkGraph(std::move(links));
}

int main(int argc, char *argv[]) {
  using namespace pagerank;

  if (argc < 2 || argc > 5) {
    print_usage(argv[0]);
    return 1;
  }

  uint64_t seed;
  size_t num_pages = 200;
  double edge_probability = 0.05;
  int64_t samples = 100000;
  try {
    seed = std::stoull(argv[1]);
    if (argc > 2) {
      num_pages = std::stoull(argv[2]);
    }
    if (argc > 3) {
      edge_probability = std::stod(argv[3]);
    }
    if (argc > 4) {
      samples = std::stoll(argv[4]);
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: Invalid argument\n";
    print_usage(argv[0]);
    return 1;
  }

  std::mt19937_64 rng(seed);
  auto graph = GenerateRandomGraph(rng, num_pages, edge_probability);
  MersenneTwisterSource random(seed);

  RankResult iterated;
  RankResult sampled;
  IterationStats stats;
  try {
    auto start_time = std::chrono::steady_clock::now();
    iterated = IteratePagerank(graph, 0.85, IterationOptions{1e-10, 1000},
                               &stats);
    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                        end_time - start_time)
                        .count();
    std::cout << "Iterations to converge: " << stats.iterations << "\n";
    std::cout << "Time to converge: " << duration << "ms\n";

    start_time = std::chrono::steady_clock::now();
    sampled = SamplePagerank(graph, 0.85, samples, random);
    end_time = std::chrono::steady_clock::now();
    duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                   end_time - start_time)
                   .count();
    std::cout << "Time to sample " << samples << " steps: " << duration
              << "ms\n\n";
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  // Top pages by iterated rank
  std::vector<std::pair<Page, double>> top(iterated.begin(), iterated.end());
  const size_t n = std::min<size_t>(10, top.size());
  std::partial_sort(
      top.begin(), top.begin() + static_cast<long>(n), top.end(),
      [](const auto &a, const auto &b) { return a.second > b.second; });
  top.resize(n);

  std::cout << "Top " << n << " pages (iterated / sampled):\n";
  for (const auto &[page, rank] : top) {
    std::cout << std::setw(10) << page << ": " << std::fixed
              << std::setprecision(6) << rank << " / " << sampled.at(page)
              << "\n";
  }

  double max_gap = 0.0;
  for (const auto &[page, rank] : iterated) {
    max_gap = std::max(max_gap, std::abs(rank - sampled.at(page)));
  }
  std::cout << "\nLargest disagreement: " << max_gap << "\n";

  return 0;
}
