// graph/algorithms/minimum_spanning_tree.h - Kruskal and Prim
// Part of the graphwalk graph library (C++20)
//
// ALGORITHMS:
//   kruskal  global edge list sorted by weight, Union-Find rejects any edge
//            whose endpoints are already connected.  O(E log E).
//   prim     grow one tree from a start node, always taking the cheapest
//            edge leaving it (binary min-heap, lazy deletion).
//            O(E log E).
//
// SEMANTICS:
// Both algorithms treat every arc as an undirected edge, so a directed
// graph is spanned as if its arcs had no direction.  kruskal spans every
// component (a minimum spanning forest); prim spans only the component
// that contains start.  spanning reports whether every node of the graph
// was covered by a single tree.
//
// Negative weights are accepted: a spanning tree's optimality depends
// only on the relative order of weights.
//
// Determinism: kruskal stable-sorts edges in node / arc insertion order,
// prim breaks heap ties by push order.

#ifndef GW_GRAPH_MINIMUM_SPANNING_TREE_H
#define GW_GRAPH_MINIMUM_SPANNING_TREE_H

#include "graph_concepts.h"
#include "graph_traits.h"
#include "union_find.h"

#include <algorithm>
#include <cstddef>
#include <queue>
#include <utility>
#include <vector>

namespace gw::graph {

/// Result of a spanning tree computation.
///
/// - edges: tree edges in the order they were accepted
/// - total_weight: sum of the accepted edge weights
/// - spanning: true if the edges connect every node of the graph
template<node_key Node, typename Weight>
struct mst_result {
    std::vector<edge<Node, Weight>> edges;
    Weight total_weight{};
    bool spanning = false;
};

// =========================================================================
// Kruskal
// =========================================================================

/// Minimum spanning forest via Kruskal's algorithm.
///
/// Example:
/// ```cpp
/// // undirected: A-B(4), A-C(1), B-C(2), C-D(5)
/// auto r = kruskal(g);
/// // r.edges == {A-C(1), B-C(2), C-D(5)}, r.total_weight == 8
/// ```
template<weighted_graph_queryable G>
[[nodiscard]] mst_result<node_t<G>, weight_t<G>>
kruskal(G const& g) {
    using Node = node_t<G>;
    using W = weight_t<G>;

    mst_result<Node, W> result;
    result.total_weight = W{0};

    // Step 1: Gather every arc (undirected graphs list each edge twice;
    // the second copy is rejected by Union-Find).
    std::vector<edge<Node, W>> candidates;
    for (auto const& u : g.nodes()) {
        for (auto const& a : g.out_neighbors(u)) {
            candidates.push_back(edge<Node, W>{u, a.target, a.weight});
        }
    }

    // Step 2: Cheapest first.
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](auto const& a, auto const& b) { return a.weight < b.weight; });

    // Step 3: Accept edges that join two different trees.
    disjoint_set<Node> forest(g.nodes());
    auto const target_edges = g.node_count() == 0 ? 0 : g.node_count() - 1;
    for (auto& e : candidates) {
        if (result.edges.size() == target_edges) break;
        if (!forest.unite(e.from, e.to)) continue;
        result.total_weight = result.total_weight + e.weight;
        result.edges.push_back(std::move(e));
    }

    result.spanning = forest.set_count() <= 1;
    return result;
}

// =========================================================================
// Prim
// =========================================================================

namespace detail {

template<typename Node, typename Weight>
struct prim_entry {
    Weight weight;
    std::size_t seq;
    Node from;
    Node to;
};

template<typename Node, typename Weight>
struct prim_entry_greater {
    bool operator()(prim_entry<Node, Weight> const& a,
                    prim_entry<Node, Weight> const& b) const {
        if (a.weight < b.weight) return false;
        if (b.weight < a.weight) return true;
        return a.seq > b.seq;
    }
};

} // namespace detail

/// Minimum spanning tree of start's component via Prim's algorithm.
///
/// An unknown start yields an empty tree.
template<weighted_graph_queryable G>
[[nodiscard]] mst_result<node_t<G>, weight_t<G>>
prim(G const& g, node_t<G> const& start) {
    using Node = node_t<G>;
    using W = weight_t<G>;
    using entry = detail::prim_entry<Node, W>;

    mst_result<Node, W> result;
    result.total_weight = W{0};
    if (!g.has_node(start)) {
        result.spanning = g.node_count() == 0;
        return result;
    }

    // Symmetric adjacency so that directed arcs can be crossed both ways.
    auto incident =
        graph_traits<G>::template make_node_map<std::vector<weighted_edge<Node, W>>>(g);
    for (auto const& u : g.nodes()) {
        for (auto const& a : g.out_neighbors(u)) {
            incident[u].push_back(a);
            if (g.directed()) {
                incident[a.target].push_back(weighted_edge<Node, W>{u, a.weight});
            }
        }
    }

    std::priority_queue<entry, std::vector<entry>,
                        detail::prim_entry_greater<Node, W>> heap;
    std::size_t seq = 0;
    auto in_tree = graph_traits<G>::make_node_set(g);

    auto absorb = [&](Node const& n) {
        in_tree.insert(n);
        auto it = incident.find(n);
        if (it == incident.end()) return;
        for (auto const& a : it->second) {
            if (!in_tree.contains(a.target)) {
                heap.push(entry{a.weight, seq++, n, a.target});
            }
        }
    };

    absorb(start);
    while (!heap.empty() && in_tree.size() < g.node_count()) {
        auto top = heap.top();
        heap.pop();
        if (in_tree.contains(top.to)) continue;  // stale entry

        result.total_weight = result.total_weight + top.weight;
        result.edges.push_back(edge<Node, W>{top.from, top.to, top.weight});
        absorb(top.to);
    }

    result.spanning = in_tree.size() == g.node_count();
    return result;
}

} // namespace gw::graph

#endif // GW_GRAPH_MINIMUM_SPANNING_TREE_H
