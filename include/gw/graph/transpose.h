// graph/transforms/transpose.h - Reverse all edge directions
// Part of the graphwalk graph library (C++20)
//
// ALGORITHM:
// Given a directed graph G, produce G^T where every arc (u->v) in G
// becomes (v->u) in G^T.  Node set, node order, edge count and weights
// are preserved.
//
// COMPLEXITY: O(V + E)
//
// Transpose is used for reverse reachability (which nodes can reach a
// target?) and for the strong connectivity check.  An undirected graph is
// its own transpose; the copy is returned unchanged.

#ifndef GW_GRAPH_TRANSPOSE_H
#define GW_GRAPH_TRANSPOSE_H

#include "adjacency_graph.h"
#include "graph_concepts.h"

namespace gw::graph {

/// Transpose a graph: reverse every arc.
///
/// Example:
/// ```cpp
/// // Diamond: 0->1, 0->2, 1->3, 2->3
/// auto gt = transpose(g);
/// // gt has arcs: 1->0, 2->0, 3->1, 3->2
/// ```
template<node_key Node, typename Weight>
[[nodiscard]] adjacency_graph<Node, Weight>
transpose(adjacency_graph<Node, Weight> const& g) {
    if (!g.directed()) return g;

    adjacency_graph<Node, Weight> out{g.kind(), g.options()};
    for (auto const& n : g.nodes()) {
        out.add_node(n);
    }
    for (auto const& u : g.nodes()) {
        for (auto const& a : g.out_neighbors(u)) {
            out.add_edge(a.target, u, a.weight);  // reversed
        }
    }
    return out;
}

} // namespace gw::graph

#endif // GW_GRAPH_TRANSPOSE_H
