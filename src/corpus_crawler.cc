#include "corpus_crawler.hh"

#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace pagerank {

namespace {
const std::regex kLinkPattern(R"re(<a\s+(?:[^>]*?)href="([^"]*)")re");

bool HasHtmlExtension(const std::string &name) {
  static const std::string kSuffix = ".html";
  return name.size() >= kSuffix.size() &&
         name.compare(name.size() - kSuffix.size(), kSuffix.size(),
                      kSuffix) == 0;
}

std::optional<std::string> ReadFile(const fs::path &path) {
  std::ifstream file(path);
  if (!file) {
    spdlog::error("Unable to open {}", path.string());
    return std::nullopt;
  }
  std::stringstream ss;
  ss << file.rdbuf();
  return ss.str();
}
} // namespace

std::set<Page> ExtractLinks(const std::string &contents) {
  std::set<Page> links;
  for (auto it = std::sregex_iterator(contents.begin(), contents.end(),
                                      kLinkPattern);
       it != std::sregex_iterator(); ++it) {
    links.insert((*it)[1].str());
  }
  return links;
}

std::optional<LinkGraph> CrawlCorpus(const std::string &directory) {
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    spdlog::error("Corpus {} is not a readable directory", directory);
    return std::nullopt;
  }

  Adjacency pages;
  for (fs::directory_iterator it(directory, ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto filename = it->path().filename().string();
    bool is_file = it->is_regular_file(ec);
    if (ec) {
      spdlog::warn("Skipping {}: {}", it->path().string(), ec.message());
      ec.clear();
      continue;
    }
    if (!is_file || !HasHtmlExtension(filename)) {
      continue;
    }
    auto contents = ReadFile(it->path());
    if (!contents.has_value()) {
      return std::nullopt;
    }
    auto links = ExtractLinks(*contents);
    links.erase(filename);
    pages.emplace(filename, std::move(links));
  }
  if (ec) {
    spdlog::error("Error listing {}: {}", directory, ec.message());
    return std::nullopt;
  }
  if (pages.empty()) {
    spdlog::error("No .html pages found in {}", directory);
    return std::nullopt;
  }

  // Only keep links to other pages of the corpus
  for (auto &[page, links] : pages) {
    for (auto it = links.begin(); it != links.end();) {
      if (pages.find(*it) == pages.end()) {
        spdlog::debug("Dropping link {} -> {} (outside corpus)", page, *it);
        it = links.erase(it);
      } else {
        ++it;
      }
    }
  }

  spdlog::info("Crawled {} pages from {}", pages.size(), directory);
  return LinkGraph(std::move(pages));
}

} // namespace pagerank
