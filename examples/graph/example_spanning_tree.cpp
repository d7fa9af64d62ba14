// examples/graph/example_spanning_tree.cpp - Kruskal and Prim: Cabling a
//                                             Campus
//
// Buildings are nodes and candidate cable runs are undirected edges
// weighted by cost.  A minimum spanning tree connects every building at
// the lowest total cost.  Kruskal and Prim pick edges in different orders
// but always reach the same total.
//
// Compile:
//   g++ -std=c++20 -O2 -I include -o example_spanning_tree examples/graph/example_spanning_tree.cpp

#include <gw/graph/adjacency_graph.h>
#include <gw/graph/graph_io.h>
#include <gw/graph/minimum_spanning_tree.h>

#include <iomanip>
#include <iostream>
#include <string>

using namespace gw::graph;

adjacency_graph<std::string, int> make_campus() {
    auto g = make_undirected<std::string, int>();
    g.add_edge("library", "lab", 7);
    g.add_edge("library", "hall", 5);
    g.add_edge("lab", "hall", 8);
    g.add_edge("lab", "gym", 9);
    g.add_edge("lab", "cafe", 7);
    g.add_edge("hall", "gym", 15);
    g.add_edge("gym", "cafe", 5);
    g.add_edge("gym", "dorm", 6);
    g.add_edge("cafe", "dorm", 8);
    g.add_edge("cafe", "office", 9);
    g.add_edge("dorm", "office", 11);
    return g;
}

template<typename Result>
void print_tree(char const* title, Result const& r) {
    std::cout << title << ":\n";
    for (auto const& e : r.edges) {
        std::cout << "  " << std::setw(8) << std::left << e.from
                  << " -- " << std::setw(8) << e.to << " cost " << e.weight << "\n";
    }
    std::cout << "  total " << r.total_weight
              << (r.spanning ? "" : " (forest: campus not fully connected)") << "\n\n";
}

int main() {
    auto const campus = make_campus();

    std::cout << "=== Campus Cabling: Minimum Spanning Tree ===\n\n";
    io::write_adjacency(std::cout, campus);
    std::cout << "\n";

    print_tree("Kruskal (cheapest edge first)", kruskal(campus));
    print_tree("Prim (grown from the library)", prim(campus, "library"));

    std::cout << "Graphviz:\n";
    io::write_dot(std::cout, campus, "campus", true);
    return 0;
}
