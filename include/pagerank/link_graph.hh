#ifndef __PAGERANK_LINK_GRAPH_HH__
#define __PAGERANK_LINK_GRAPH_HH__

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace pagerank {

// A page is identified by its file name, e.g. "1.html".
using Page = std::string;

// Raw adjacency as produced by the crawler: page -> pages it links to.
using Adjacency = std::map<Page, std::set<Page>>;

// Page -> probability. Every page of the graph is present, values sum to 1.
using ProbabilityDistribution = std::map<Page, double>;

// Page -> estimated rank in [0, 1]. Values sum to 1.
using RankResult = std::map<Page, double>;

/**
 * @brief Immutable hyperlink graph over a closed corpus
 *
 * @details Construction validates that every link target is itself a page of
 * the graph and that no page links to itself. Pages are kept in sorted order
 * and also addressable by a dense index, which is what the estimators iterate
 * over.
 */
class LinkGraph {
public:
  LinkGraph() = default;
  explicit LinkGraph(Adjacency links);

  size_t Size() const { return pages_.size(); }
  bool Empty() const { return pages_.empty(); }
  bool Contains(const Page &page) const;

  // Pages in sorted order. Position in this vector is the page's index.
  const std::vector<Page> &Pages() const { return pages_; }

  // Throws PreconditionError if the page is not part of the graph.
  const std::set<Page> &LinksFrom(const Page &page) const;
  size_t IndexOf(const Page &page) const;

  // Outgoing links of the page at `index`, as indices.
  const std::vector<size_t> &OutLinks(size_t index) const {
    return out_links_.at(index);
  }
  bool IsDangling(size_t index) const { return OutLinks(index).empty(); }

private:
  Adjacency links_;
  std::vector<Page> pages_;
  std::unordered_map<Page, size_t> index_;
  std::vector<std::vector<size_t>> out_links_;
};

} // namespace pagerank

#endif
