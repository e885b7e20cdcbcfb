#ifndef __PAGERANK_CORPUS_CRAWLER_HH__
#define __PAGERANK_CORPUS_CRAWLER_HH__

#include "link_graph.hh"
#include <optional>
#include <string>

namespace pagerank {

// Extract the href targets of all <a> tags in an HTML document.
std::set<Page> ExtractLinks(const std::string &contents);

// Build the link graph of every *.html file directly inside `directory`.
// Self links and links to pages outside the corpus are dropped.
// Returns std::nullopt if the directory can't be read or holds no pages.
std::optional<LinkGraph> CrawlCorpus(const std::string &directory);

} // namespace pagerank

#endif
