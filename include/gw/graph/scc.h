// graph/algorithms/scc.h - Strongly connected components (Tarjan)
// Part of the graphwalk graph library (C++20)
//
// ALGORITHM: Iterative Tarjan's algorithm.
// Complexity: O(V + E)
// Determinism: roots are tried in node order and arcs in insertion order.
// Component numbering follows reverse topological order of the
// condensation (SCCs are numbered as they are completed).
//
// DESIGN RATIONALE:
// Iterative (not recursive) so that long chains do not exhaust the call
// stack.  An explicit call stack holds one frame per active node with an
// iterator to the next arc to examine.

#ifndef GW_GRAPH_SCC_H
#define GW_GRAPH_SCC_H

#include "graph_concepts.h"
#include "graph_traits.h"

#include <cstddef>
#include <utility>
#include <vector>

namespace gw::graph {

/// Result of strongly connected components analysis.
///
/// - components[k]: members of SCC k, in the order Tarjan's stack popped
///   them
/// - component_of[n]: SCC id of node n
///
/// Ids are assigned in reverse topological order of the condensation DAG
/// (sink SCCs get the lowest ids).
template<graph_queryable G>
struct scc_result {
    std::vector<std::vector<node_t<G>>> components;
    node_map_t<G, std::size_t> component_of;

    [[nodiscard]] std::size_t count() const noexcept { return components.size(); }
};

/// Strongly connected components via iterative Tarjan's algorithm.
///
/// Example:
/// ```cpp
/// // DAG: each node is its own SCC
/// // 0->1->2->3
/// auto r = strongly_connected_components(g);   // r.count() == 4
///
/// // Cycle: 0->1->2->0 all in one SCC
/// auto r2 = strongly_connected_components(g2); // r2.count() == 1
/// ```
template<graph_queryable G>
[[nodiscard]] scc_result<G>
strongly_connected_components(G const& g) {
    using Node = node_t<G>;
    using range_t = decltype(g.out_neighbors(std::declval<Node const&>()));
    using iter_t = decltype(std::declval<range_t const&>().begin());

    scc_result<G> result;
    result.component_of = graph_traits<G>::template make_node_map<std::size_t>(g);

    // Tarjan's state.
    auto index_of = graph_traits<G>::template make_node_map<std::size_t>(g);
    auto lowlink = graph_traits<G>::template make_node_map<std::size_t>(g);
    auto on_stack = graph_traits<G>::make_node_set(g);
    std::vector<Node> tarjan_stack;

    // DFS call stack frame.
    struct frame {
        Node node;
        iter_t next;
        iter_t end;
    };
    std::vector<frame> call_stack;

    std::size_t next_index = 0;

    auto enter = [&](Node const& n) {
        index_of.emplace(n, next_index);
        lowlink.emplace(n, next_index);
        ++next_index;
        on_stack.insert(n);
        tarjan_stack.push_back(n);
        auto const range = g.out_neighbors(n);
        call_stack.push_back(frame{n, range.begin(), range.end()});
    };

    for (auto const& start : g.nodes()) {
        if (index_of.contains(start)) continue;

        enter(start);
        while (!call_stack.empty()) {
            auto& top = call_stack.back();

            if (top.next != top.end) {
                Node w = top.next->target;
                ++top.next;

                if (!index_of.contains(w)) {
                    // Tree edge: "recurse" into w.
                    enter(w);  // invalidates top
                } else if (on_stack.contains(w)) {
                    // Back edge: update lowlink.
                    auto& low = lowlink.at(top.node);
                    if (index_of.at(w) < low) low = index_of.at(w);
                }
                continue;
            }

            // All neighbours processed.  Check if this is an SCC root.
            Node u = std::move(top.node);
            call_stack.pop_back();

            if (lowlink.at(u) == index_of.at(u)) {
                auto const comp_id = result.components.size();
                auto& members = result.components.emplace_back();
                for (;;) {
                    Node w = std::move(tarjan_stack.back());
                    tarjan_stack.pop_back();
                    on_stack.erase(w);
                    result.component_of.insert_or_assign(w, comp_id);
                    bool const done = (w == u);
                    members.push_back(std::move(w));
                    if (done) break;
                }
            }

            // Update parent's lowlink.
            if (!call_stack.empty()) {
                auto& parent_low = lowlink.at(call_stack.back().node);
                if (lowlink.at(u) < parent_low) parent_low = lowlink.at(u);
            }
        }
    }

    return result;
}

} // namespace gw::graph

#endif // GW_GRAPH_SCC_H
