// graph/algorithms/topological_sort.h - Topological ordering
// Part of the graphwalk graph library (C++20)
//
// ALGORITHMS:
//   topological_sort      Kahn's algorithm (BFS-based)
//   topological_sort_dfs  reverse DFS post-order
// Complexity: O(V + E)
// Determinism: zero-in-degree nodes are seeded in node order and released
// first-in first-out, so the order is reproducible.
//
// DESIGN RATIONALE:
// Kahn's is the primary method because:
// - Naturally produces the order in forward sequence
// - Detects cycles (if output size < V, graph has a cycle)
// - No recursion
//
// On a cycle the partial order is discarded: callers never see an order
// that silently omits nodes.  cyclic_nodes reports what was left behind.
//
// An arc is a dependency "u before v".  Undirected graphs store every
// edge in both directions and so never have a topological order unless
// they have no edges.

#ifndef GW_GRAPH_TOPOLOGICAL_SORT_H
#define GW_GRAPH_TOPOLOGICAL_SORT_H

#include "cycle_detection.h"
#include "graph_concepts.h"
#include "graph_traits.h"
#include "traversal.h"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <utility>
#include <vector>

namespace gw::graph {

/// Result of topological sort.
///
/// - order: nodes in topological order (dependencies before dependents),
///   empty when is_dag is false
/// - is_dag: true if graph is a DAG; false if a cycle was detected
/// - cyclic_nodes: when is_dag is false, the nodes that could not be
///   ordered (Kahn: every node on or downstream of a cycle; DFS: the nodes
///   of the cycle found)
template<node_key Node>
struct topo_result {
    std::vector<Node> order;
    bool is_dag = true;
    std::vector<Node> cyclic_nodes;
};

/// Topological sort via Kahn's algorithm.
///
/// Example:
/// ```cpp
/// // A->B, A->C, B->D, C->D
/// auto r = topological_sort(g);
/// // r.is_dag, r.order == {A, B, C, D}
/// ```
template<graph_queryable G>
[[nodiscard]] topo_result<node_t<G>>
topological_sort(G const& g) {
    using Node = node_t<G>;

    topo_result<Node> result;

    // Step 1: Compute in-degrees.
    auto in_degree = graph_traits<G>::template make_node_map<std::size_t>(g);
    for (auto const& u : g.nodes()) {
        in_degree.try_emplace(u, 0);
    }
    for (auto const& u : g.nodes()) {
        for (auto const& a : g.out_neighbors(u)) {
            ++in_degree[a.target];
        }
    }

    // Step 2: Seed with the nodes that have no dependencies.
    std::deque<Node> ready;
    for (auto const& u : g.nodes()) {
        if (in_degree.at(u) == 0) ready.push_back(u);
    }

    // Step 3: Kahn's iteration.
    while (!ready.empty()) {
        Node u = std::move(ready.front());
        ready.pop_front();

        for (auto const& a : g.out_neighbors(u)) {
            if (--in_degree.at(a.target) == 0) {
                ready.push_back(a.target);
            }
        }
        result.order.push_back(std::move(u));
    }

    if (result.order.size() != g.node_count()) {
        result.is_dag = false;
        result.order.clear();
        for (auto const& u : g.nodes()) {
            if (in_degree.at(u) > 0) result.cyclic_nodes.push_back(u);
        }
    }
    return result;
}

/// Topological sort by reverse DFS post-order.
///
/// Roots are tried in node order.  The cycle check runs first, so on
/// cyclic input cyclic_nodes holds one cycle (without the repeated node).
template<graph_queryable G>
[[nodiscard]] topo_result<node_t<G>>
topological_sort_dfs(G const& g) {
    using Node = node_t<G>;
    using range_t = decltype(g.out_neighbors(std::declval<Node const&>()));
    using iter_t = decltype(std::declval<range_t const&>().begin());

    topo_result<Node> result;

    auto cycle = find_cycle_directed(g, dfs_strategy::iterative);
    if (cycle.found) {
        result.is_dag = false;
        result.cyclic_nodes.assign(cycle.cycle.begin(), cycle.cycle.end() - 1);
        return result;
    }

    struct frame {
        Node node;
        iter_t next;
        iter_t end;
    };
    std::vector<frame> call_stack;
    auto visited = graph_traits<G>::make_node_set(g);

    auto enter = [&](Node const& n) {
        visited.insert(n);
        auto const range = g.out_neighbors(n);
        call_stack.push_back(frame{n, range.begin(), range.end()});
    };

    for (auto const& root : g.nodes()) {
        if (visited.contains(root)) continue;
        enter(root);
        while (!call_stack.empty()) {
            auto& top = call_stack.back();
            if (top.next == top.end) {
                result.order.push_back(std::move(top.node));  // post-order
                call_stack.pop_back();
                continue;
            }
            Node w = top.next->target;
            ++top.next;
            if (!visited.contains(w)) enter(w);  // invalidates top
        }
    }

    std::reverse(result.order.begin(), result.order.end());
    return result;
}

/// True if order lists every node of g exactly once and every arc u->v
/// has u before v.
template<graph_queryable G>
[[nodiscard]] bool
is_valid_topological_order(G const& g, std::vector<node_t<G>> const& order) {
    if (order.size() != g.node_count()) return false;

    auto position = graph_traits<G>::template make_node_map<std::size_t>(g);
    for (std::size_t i = 0; i < order.size(); ++i) {
        if (!g.has_node(order[i])) return false;
        if (!position.emplace(order[i], i).second) return false;  // repeated
    }

    for (auto const& u : g.nodes()) {
        for (auto const& a : g.out_neighbors(u)) {
            if (position.at(a.target) <= position.at(u)) return false;
        }
    }
    return true;
}

} // namespace gw::graph

#endif // GW_GRAPH_TOPOLOGICAL_SORT_H
