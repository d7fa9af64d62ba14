// examples/graph/example_web_crawler.cpp - Bounded BFS: Crawling a Site
//
// Pages are nodes and hyperlinks are directed arcs.  A crawler explores
// breadth-first so that pages close to the seed are fetched first, and
// stops either at a depth limit (bfs_within) or a page budget
// (bfs_limited).  An observer logs each fetch as it happens.
//
// Compile:
//   g++ -std=c++20 -O2 -I include -o example_web_crawler examples/graph/example_web_crawler.cpp

#include <gw/graph/adjacency_graph.h>
#include <gw/graph/connected_components.h>
#include <gw/graph/observer.h>
#include <gw/graph/scc.h>
#include <gw/graph/traversal.h>

#include <cstddef>
#include <iostream>
#include <string>

using namespace gw::graph;

adjacency_graph<std::string> make_site() {
    adjacency_graph<std::string> g;
    g.add_edge("/", "/about");
    g.add_edge("/", "/blog");
    g.add_edge("/", "/products");
    g.add_edge("/about", "/team");
    g.add_edge("/about", "/");
    g.add_edge("/blog", "/blog/graphs");
    g.add_edge("/blog", "/blog/cpp20");
    g.add_edge("/blog/graphs", "/blog/cpp20");
    g.add_edge("/blog/cpp20", "/blog");
    g.add_edge("/products", "/products/widget");
    g.add_edge("/products/widget", "/checkout");
    g.add_node("/orphan");
    return g;
}

// Prints each page when it is fetched and counts outgoing links seen.
struct fetch_logger : null_observer {
    std::size_t links = 0;

    void visit(std::string const& page) {
        std::cout << "  fetch " << page << "\n";
    }
    template<typename W>
    void examine(std::string const&, std::string const&, W const&) {
        ++links;
    }
};

int main() {
    auto const site = make_site();

    std::cout << "=== Web Crawler: Bounded BFS ===\n\n";
    std::cout << "Full crawl from /:\n";
    fetch_logger log;
    auto const crawled = bfs(site, "/", log);
    std::cout << crawled.size() << " pages, " << log.links << " links followed\n";

    std::cout << "\nPages within 1 click of /:\n";
    for (auto const& p : bfs_within(site, "/", 1)) std::cout << "  " << p << "\n";

    std::cout << "\nCrawl budget of 5 pages:\n";
    for (auto const& p : bfs_limited(site, "/", 5)) std::cout << "  " << p << "\n";

    std::cout << "\nPages by click depth:\n";
    auto const levels = bfs_levels(site, "/");
    for (std::size_t d = 0; d < levels.size(); ++d) {
        std::cout << "  depth " << d << ": " << levels[d].size() << " page(s)\n";
    }

    auto const seen = reachable(site, "/");
    std::cout << "\nUnreachable from /:\n";
    for (auto const& p : site.nodes()) {
        if (!seen.contains(p)) std::cout << "  " << p << "\n";
    }

    // Groups of pages that all link back to each other.
    auto const scc = strongly_connected_components(site);
    std::cout << "\nLink clusters (mutually reachable):\n";
    for (auto const& c : scc.components) {
        if (c.size() < 2) continue;
        std::cout << " ";
        for (auto const& p : c) std::cout << " " << p;
        std::cout << "\n";
    }
    std::cout << "Site strongly connected: "
              << (is_strongly_connected(site) ? "yes" : "no") << "\n";
    return 0;
}
