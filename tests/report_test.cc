// tests/report_test.cc
#include "report.hh"
#include "errors.hh"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace pagerank {
namespace {

namespace fs = std::filesystem;

// Fails every draw, like a broken generator would.
struct FailingSource : RandomSource {
  size_t ChooseIndex(const std::vector<double> &) override {
    throw std::logic_error("generator failure");
  }
};

// Always answers with an index past the end of the weights.
struct OutOfRangeSource : RandomSource {
  size_t ChooseIndex(const std::vector<double> &weights) override {
    return weights.size();
  }
};

class ReportTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("pagerank_report_" + std::to_string(getpid()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(dir_);
    options_.corpus = dir_.string();
    options_.seed = 11;
  }

  void TearDown() override { fs::remove_all(dir_); }

  void WritePage(const std::string &name, const std::string &contents) {
    std::ofstream out(dir_ / name);
    out << contents;
  }

  fs::path dir_;
  Options options_;
  std::ostringstream out_;
  std::ostringstream err_;
  LinkGraph corpus_{Adjacency{{"1.html", {"2.html"}},
                              {"2.html", {"1.html", "3.html"}},
                              {"3.html", {"2.html", "4.html"}},
                              {"4.html", {"2.html"}}}};
};

TEST_F(ReportTest, PrintsBothTablesSortedWithFourDecimals) {
  RankReport report;
  report.sampled = {{"b.html", 0.25}, {"a.html", 0.75}};
  report.iterated = {{"b.html", 0.3}, {"a.html", 0.7}};

  PrintReport(out_, report, 10000);

  EXPECT_EQ(out_.str(), "PageRank Results from Sampling (n = 10000)\n"
                        "  a.html: 0.7500\n"
                        "  b.html: 0.2500\n"
                        "PageRank Results from Iteration\n"
                        "  a.html: 0.7000\n"
                        "  b.html: 0.3000\n");
}

TEST_F(ReportTest, RunRankingPrintsSinglePageCorpus) {
  WritePage("1.html", "<p>alone</p>");
  options_.samples = 100;

  EXPECT_EQ(RunRanking(options_, out_, err_), 0);
  EXPECT_EQ(out_.str(), "PageRank Results from Sampling (n = 100)\n"
                        "  1.html: 1.0000\n"
                        "PageRank Results from Iteration\n"
                        "  1.html: 1.0000\n");
  EXPECT_TRUE(err_.str().empty());
}

TEST_F(ReportTest, RunRankingFailsOnMissingCorpus) {
  options_.corpus = (dir_ / "missing").string();
  EXPECT_EQ(RunRanking(options_, out_, err_), 1);
  EXPECT_TRUE(out_.str().empty());
  EXPECT_NE(err_.str().find("unable to build link graph"), std::string::npos);
}

TEST_F(ReportTest, RunRankingFailsWhenIterationDoesNotConverge) {
  WritePage("1.html", "<a href=\"2.html\">2</a>");
  WritePage("2.html", "dead end");
  options_.iteration.max_iterations = 1;

  EXPECT_EQ(RunRanking(options_, out_, err_), 1);
  EXPECT_TRUE(out_.str().empty());
  EXPECT_NE(err_.str().find("did not converge"), std::string::npos);
}

TEST_F(ReportTest, RunRankingFailsOnInvalidSampleCount) {
  WritePage("1.html", "<p>alone</p>");
  options_.samples = 0;
  EXPECT_EQ(RunRanking(options_, out_, err_), 1);
  EXPECT_TRUE(out_.str().empty());
}

TEST_F(ReportTest, RunRankingReportsUnexpectedErrors) {
  WritePage("1.html", "<a href=\"2.html\">2</a>");
  WritePage("2.html", "<a href=\"1.html\">1</a>");
  OutOfRangeSource random;

  EXPECT_EQ(RunRanking(options_, random, out_, err_), 1);
  EXPECT_TRUE(out_.str().empty());
  EXPECT_NE(err_.str().find("Random source returned index"),
            std::string::npos);
}

TEST_F(ReportTest, ParallelRunMatchesSerialRun) {
  options_.samples = 5000;
  options_.parallel = false;
  auto serial = RankCorpus(corpus_, options_);
  options_.parallel = true;
  auto parallel = RankCorpus(corpus_, options_);

  EXPECT_EQ(serial.sampled, parallel.sampled);
  EXPECT_EQ(serial.iterated, parallel.iterated);
  EXPECT_EQ(serial.stats.iterations, parallel.stats.iterations);
}

TEST_F(ReportTest, ParallelRunRethrowsSamplerError) {
  options_.parallel = true;
  FailingSource random;
  EXPECT_THROW(RankCorpus(corpus_, options_, random), std::logic_error);
}

TEST_F(ReportTest, ParallelRunRethrowsIterationError) {
  options_.parallel = true;
  options_.iteration.max_iterations = 1;
  MersenneTwisterSource random(5);
  EXPECT_THROW(RankCorpus(corpus_, options_, random), ConvergenceError);
}

} // namespace
} // namespace pagerank

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
