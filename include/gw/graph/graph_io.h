// graph/graph_io.h - Text rendering and representation conversion
// Part of the graphwalk graph library (C++20)
//
// Writers for the three classic graph representations plus Graphviz DOT:
//
//   write_adjacency   "u -> [v, w]" per node, in node order
//   write_edge_list   "u v weight" per logical edge
//   write_dot         digraph / graph for Graphviz
//   adjacency_matrix  dense 0/1 matrix indexed by node order
//   from_edge_list    build an adjacency_graph from (u, v, w) records
//
// Uses <ostream>, not <iostream>, so including this header does not pull
// in the static initialisation of std::cout and friends.  Writers require
// node keys (and weights, where printed) to be streamable.

#ifndef GW_GRAPH_IO_H
#define GW_GRAPH_IO_H

#include "adjacency_graph.h"
#include "graph_concepts.h"
#include "graph_traits.h"

#include <concepts>
#include <cstddef>
#include <ostream>
#include <string_view>
#include <vector>

namespace gw::graph::io {

/// A type that can be written with operator<<.
template<typename T>
concept streamable = requires(std::ostream& os, T const& t) {
    { os << t } -> std::same_as<std::ostream&>;
};

/// Write one line per node listing its neighbours.
///
/// Example output:
/// ```
/// Directed graph (5 nodes, 4 edges):
///   0 -> [1, 3]
///   1 -> [2]
///   2 -> []
/// ```
template<node_key Node, typename Weight>
    requires streamable<Node>
void write_adjacency(std::ostream& os, adjacency_graph<Node, Weight> const& g) {
    os << (g.directed() ? "Directed" : "Undirected") << " graph ("
       << g.node_count() << " nodes, " << g.edge_count() << " edges):\n";
    for (auto const& u : g.nodes()) {
        os << "  " << u << " -> [";
        bool first = true;
        for (auto const& a : g.out_neighbors(u)) {
            if (!first) os << ", ";
            os << a.target;
            first = false;
        }
        os << "]\n";
    }
}

/// Write one "u v weight" line per logical edge (see adjacency_graph::edges).
template<node_key Node, typename Weight>
    requires streamable<Node> && streamable<Weight>
void write_edge_list(std::ostream& os, adjacency_graph<Node, Weight> const& g) {
    for (auto const& e : g.edges()) {
        os << e.from << ' ' << e.to << ' ' << e.weight << '\n';
    }
}

/// Write g in Graphviz DOT format.  Isolated nodes are emitted standalone
/// so they appear in the drawing.  Weights are written as edge labels when
/// with_weights is set.
///
/// Example output:
/// ```dot
/// digraph G {
///   "0" -> "1";
///   "0" -> "3";
/// }
/// ```
template<node_key Node, typename Weight>
    requires streamable<Node> && streamable<Weight>
void write_dot(std::ostream& os, adjacency_graph<Node, Weight> const& g,
               std::string_view graph_name = "G", bool with_weights = false) {
    char const* edge_op = g.directed() ? " -> " : " -- ";
    os << (g.directed() ? "digraph " : "graph ") << graph_name << " {\n";

    for (auto const& u : g.nodes()) {
        if (g.degree(u).total == 0) {
            os << "  \"" << u << "\";\n";
        }
    }
    for (auto const& e : g.edges()) {
        os << "  \"" << e.from << '"' << edge_op << '"' << e.to << '"';
        if (with_weights) os << " [label=\"" << e.weight << "\"]";
        os << ";\n";
    }
    os << "}\n";
}

/// Dense 0/1 adjacency matrix: m[i][j] == 1 iff nodes()[i] -> nodes()[j].
template<graph_queryable G>
[[nodiscard]] std::vector<std::vector<int>> adjacency_matrix(G const& g) {
    auto const V = g.node_count();
    auto index = graph_traits<G>::template make_node_map<std::size_t>(g);
    std::size_t i = 0;
    for (auto const& n : g.nodes()) index.emplace(n, i++);

    std::vector<std::vector<int>> m(V, std::vector<int>(V, 0));
    for (auto const& u : g.nodes()) {
        for (auto const& a : g.out_neighbors(u)) {
            m[index.at(u)][index.at(a.target)] = 1;
        }
    }
    return m;
}

/// Build a graph from (from, to, weight) records.  Duplicates are dropped
/// by add_edge.
template<node_key Node, typename Weight>
[[nodiscard]] adjacency_graph<Node, Weight>
from_edge_list(std::vector<edge<Node, Weight>> const& edges,
               graph_kind kind = graph_kind::directed,
               graph_options opts = {}) {
    adjacency_graph<Node, Weight> g{kind, opts};
    for (auto const& e : edges) {
        g.add_edge(e.from, e.to, e.weight);
    }
    return g;
}

} // namespace gw::graph::io

#endif // GW_GRAPH_IO_H
