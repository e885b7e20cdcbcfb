// tests/link_graph_test.cc
#include "link_graph.hh"
#include "errors.hh"

#include <gtest/gtest.h>

namespace pagerank {
namespace {

class LinkGraphTest : public ::testing::Test {
protected:
  LinkGraph graph_{Adjacency{{"1.html", {"2.html"}},
                             {"2.html", {"1.html", "3.html"}},
                             {"3.html", {}}}};
};

TEST_F(LinkGraphTest, PagesAreSortedAndIndexed) {
  ASSERT_EQ(graph_.Size(), 3u);
  EXPECT_EQ(graph_.Pages(),
            (std::vector<Page>{"1.html", "2.html", "3.html"}));
  EXPECT_EQ(graph_.IndexOf("1.html"), 0u);
  EXPECT_EQ(graph_.IndexOf("3.html"), 2u);
}

TEST_F(LinkGraphTest, OutLinksMatchAdjacency) {
  EXPECT_EQ(graph_.OutLinks(0), (std::vector<size_t>{1}));
  EXPECT_EQ(graph_.OutLinks(1), (std::vector<size_t>{0, 2}));
  EXPECT_TRUE(graph_.IsDangling(2));
  EXPECT_FALSE(graph_.IsDangling(0));
  EXPECT_EQ(graph_.LinksFrom("2.html"),
            (std::set<Page>{"1.html", "3.html"}));
}

TEST_F(LinkGraphTest, ContainsOnlyCorpusPages) {
  EXPECT_TRUE(graph_.Contains("2.html"));
  EXPECT_FALSE(graph_.Contains("4.html"));
}

TEST_F(LinkGraphTest, UnknownPageIsRejected) {
  EXPECT_THROW(graph_.LinksFrom("4.html"), PreconditionError);
  EXPECT_THROW(graph_.IndexOf("4.html"), PreconditionError);
}

TEST(LinkGraphValidationTest, RejectsSelfLink) {
  EXPECT_THROW(LinkGraph(Adjacency{{"1.html", {"1.html"}}}),
               PreconditionError);
}

TEST(LinkGraphValidationTest, RejectsLinkOutsideCorpus) {
  EXPECT_THROW(LinkGraph(Adjacency{{"1.html", {"2.html"}}}),
               PreconditionError);
}

TEST(LinkGraphValidationTest, DefaultGraphIsEmpty) {
  LinkGraph graph;
  EXPECT_TRUE(graph.Empty());
  EXPECT_EQ(graph.Size(), 0u);
}

} // namespace
} // namespace pagerank

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
