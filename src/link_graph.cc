#include "link_graph.hh"
#include "errors.hh"

#include <spdlog/fmt/fmt.h>
#include <utility>

namespace pagerank {

LinkGraph::LinkGraph(Adjacency links) : links_(std::move(links)) {
  pages_.reserve(links_.size());
  for (const auto &[page, targets] : links_) {
    (void)targets;
    index_.emplace(page, pages_.size());
    pages_.push_back(page);
  }

  out_links_.resize(pages_.size());
  for (const auto &[page, targets] : links_) {
    auto &out = out_links_[index_.at(page)];
    out.reserve(targets.size());
    for (const auto &target : targets) {
      if (target == page) {
        throw PreconditionError(
            fmt::format("Page '{}' links to itself", page));
      }
      auto it = index_.find(target);
      if (it == index_.end()) {
        throw PreconditionError(fmt::format(
            "Page '{}' links to '{}', which is not in the corpus", page,
            target));
      }
      out.push_back(it->second);
    }
  }
}

bool LinkGraph::Contains(const Page &page) const {
  return index_.find(page) != index_.end();
}

const std::set<Page> &LinkGraph::LinksFrom(const Page &page) const {
  auto it = links_.find(page);
  if (it == links_.end()) {
    throw PreconditionError(fmt::format("Unknown page '{}'", page));
  }
  return it->second;
}

size_t LinkGraph::IndexOf(const Page &page) const {
  auto it = index_.find(page);
  if (it == index_.end()) {
    throw PreconditionError(fmt::format("Unknown page '{}'", page));
  }
  return it->second;
}

} // namespace pagerank
