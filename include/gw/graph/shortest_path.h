// graph/algorithms/shortest_path.h - Unweighted (BFS) and weighted (Dijkstra)
//                                    shortest paths
// Part of the graphwalk graph library (C++20)
//
// ALGORITHMS:
//   shortest_path  BFS with parent pointers.  O(V + E).
//   dijkstra       binary min-heap with lazy deletion.  O((V + E) log V).
//
// DESIGN RATIONALE:
// Dijkstra pushes a fresh (distance, node) entry on every improvement
// instead of decreasing a key in place.  An entry popped for a node that
// is already settled is stale and is discarded.  A node's distance is
// final the first time it is popped, so no settled node is ever relaxed
// again.  Heap ties are broken by push order, which keeps settle order
// deterministic for equal distances.
//
// The single-target overload stops as soon as the target is settled.
// Because settle order is identical up to that point, the cost it
// reports equals the all-targets distance to the same node.
//
// PRECONDITION:
// All edge weights must be non-negative.  dijkstra scans the graph before
// searching and throws std::invalid_argument if any arc is negative,
// rather than returning distances that silently violate optimality.

#ifndef GW_GRAPH_SHORTEST_PATH_H
#define GW_GRAPH_SHORTEST_PATH_H

#include "graph_concepts.h"
#include "graph_traits.h"
#include "observer.h"

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <deque>
#include <optional>
#include <queue>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace gw::graph {

// =========================================================================
// Result types
// =========================================================================

/// A path together with its accumulated weight.
template<node_key Node, typename Weight>
struct weighted_path {
    Weight cost{};
    path<Node> nodes;
};

/// Result of Dijkstra's all-targets computation.
///
/// - dist[n]: shortest distance from source to n (absent if unreachable)
/// - pred[n]: predecessor of n on its shortest path (absent for source)
/// - settled: nodes in the order their distance became final
/// - verified: true if verify_shortest_path has confirmed correctness
template<graph_queryable G>
struct shortest_path_result {
    node_t<G> source{};
    node_map_t<G, weight_t<G>> dist;
    node_map_t<G, node_t<G>> pred;
    std::vector<node_t<G>> settled;
    bool verified = false;

    [[nodiscard]] bool reached(node_t<G> const& n) const {
        return dist.contains(n);
    }

    [[nodiscard]] std::optional<weight_t<G>>
    distance_to(node_t<G> const& n) const {
        auto it = dist.find(n);
        if (it == dist.end()) return std::nullopt;
        return it->second;
    }
};

// =========================================================================
// Unweighted shortest path (BFS)
// =========================================================================

namespace detail {

/// Walk predecessor links back from target to source.
template<typename PredMap, typename Node>
[[nodiscard]] path<Node>
walk_predecessors(PredMap const& pred, Node const& source, Node const& target) {
    path<Node> p{target};
    Node cur = target;
    while (!(cur == source)) {
        cur = pred.at(cur);
        p.push_back(cur);
    }
    std::reverse(p.begin(), p.end());
    return p;
}

template<typename W>
[[nodiscard]] bool weight_less(W const& a, W const& b) {
    if constexpr (std::is_floating_point_v<W>) {
        return a < b - W(1e-12);
    } else {
        return a < b;
    }
}

template<typename W>
[[nodiscard]] bool weight_equal(W const& a, W const& b) {
    return !weight_less(a, b) && !weight_less(b, a);
}

} // namespace detail

/// Minimum-edge-count path from start to target.
///
/// Returns {start} when start == target and std::nullopt when target is
/// unreachable.  The first path that reaches the target is minimal because
/// BFS marks nodes at discovery time.
///
/// Example:
/// ```cpp
/// // 0->1, 1->2, 0->3, 3->4
/// auto p = shortest_path(g, 0, 4);   // {0, 3, 4}
/// ```
template<graph_queryable G>
[[nodiscard]] std::optional<path<node_t<G>>>
shortest_path(G const& g, node_t<G> const& start, node_t<G> const& target) {
    using Node = node_t<G>;

    if (start == target) return path<Node>{start};

    auto pred = graph_traits<G>::template make_node_map<Node>(g);
    auto visited = graph_traits<G>::make_node_set(g);
    std::deque<Node> queue{start};
    visited.insert(start);

    while (!queue.empty()) {
        Node u = std::move(queue.front());
        queue.pop_front();
        for (auto const& a : g.out_neighbors(u)) {
            if (!visited.insert(a.target).second) continue;
            pred.emplace(a.target, u);
            if (a.target == target) {
                return detail::walk_predecessors(pred, start, target);
            }
            queue.push_back(a.target);
        }
    }
    return std::nullopt;
}

// =========================================================================
// Dijkstra
// =========================================================================

/// Throw std::invalid_argument if any arc of g has a negative weight.
template<weighted_graph_queryable G>
void require_non_negative_weights(G const& g, char const* algo_name) {
    using W = weight_t<G>;
    for (auto const& u : g.nodes()) {
        for (auto const& a : g.out_neighbors(u)) {
            if (a.weight < W{0}) {
                throw std::invalid_argument(
                    std::string(algo_name) + ": negative edge weight");
            }
        }
    }
}

namespace detail {

template<typename Node, typename Weight>
struct heap_entry {
    Weight dist;
    std::size_t seq;
    Node node;
};

template<typename Node, typename Weight>
struct heap_entry_greater {
    bool operator()(heap_entry<Node, Weight> const& a,
                    heap_entry<Node, Weight> const& b) const {
        if (a.dist < b.dist) return false;
        if (b.dist < a.dist) return true;
        return a.seq > b.seq;
    }
};

template<typename Node, typename Weight>
using min_heap = std::priority_queue<heap_entry<Node, Weight>,
                                     std::vector<heap_entry<Node, Weight>>,
                                     heap_entry_greater<Node, Weight>>;

/// Core loop shared by both dijkstra overloads.  Stops early when
/// stop_at is set and that node is settled.  Returns true if stopped.
template<weighted_graph_queryable G, typename Observer>
bool dijkstra_run(G const& g, shortest_path_result<G>& r,
                  node_t<G> const* stop_at, Observer& obs) {
    using Node = node_t<G>;
    using W = weight_t<G>;

    auto finalised = graph_traits<G>::make_node_set(g);
    min_heap<Node, W> heap;
    std::size_t seq = 0;

    r.dist.emplace(r.source, W{0});
    heap.push({W{0}, seq++, r.source});
    obs.discover(r.source);

    while (!heap.empty()) {
        auto top = heap.top();
        heap.pop();

        if (!finalised.insert(top.node).second) continue;  // stale entry

        r.settled.push_back(top.node);
        obs.visit(top.node);
        if (stop_at != nullptr && top.node == *stop_at) return true;

        for (auto const& a : g.out_neighbors(top.node)) {
            obs.examine(top.node, a.target, a.weight);
            if (finalised.contains(a.target)) continue;

            W const candidate = top.dist + a.weight;
            auto it = r.dist.find(a.target);
            if (it == r.dist.end() || candidate < it->second) {
                if (it == r.dist.end()) {
                    obs.discover(a.target);
                    r.dist.emplace(a.target, candidate);
                } else {
                    it->second = candidate;
                }
                r.pred.insert_or_assign(a.target, top.node);
                heap.push({candidate, seq++, a.target});
                obs.relax(top.node, a.target, candidate);
            }
        }
    }
    return false;
}

} // namespace detail

/// Follow predecessors from target back to the result's source.
/// std::nullopt if target was not reached.
template<graph_queryable G>
[[nodiscard]] std::optional<path<node_t<G>>>
reconstruct_path(shortest_path_result<G> const& r, node_t<G> const& target) {
    if (!r.reached(target)) return std::nullopt;
    return detail::walk_predecessors(r.pred, r.source, target);
}

/// O(V + E) verification of shortest-path optimality.
///
/// Checks that dist[source] == 0, that no arc out of a reached node can
/// improve its target (triangle inequality, unreached targets included),
/// and that pred[v] == u implies dist[v] == dist[u] + w(u, v).
template<weighted_graph_queryable G>
[[nodiscard]] bool
verify_shortest_path(G const& g, shortest_path_result<G>& r) {
    using W = weight_t<G>;

    auto src = r.dist.find(r.source);
    if (src == r.dist.end() || !detail::weight_equal(src->second, W{0})) {
        r.verified = false;
        return false;
    }

    for (auto const& [u, du] : r.dist) {
        for (auto const& a : g.out_neighbors(u)) {
            auto it = r.dist.find(a.target);
            if (it == r.dist.end() ||
                detail::weight_less(du + a.weight, it->second)) {
                r.verified = false;
                return false;
            }
        }
    }

    for (auto const& [v, p] : r.pred) {
        auto const w = g.edge_weight(p, v);
        if (!w || !detail::weight_equal(r.dist.at(v), r.dist.at(p) + *w)) {
            r.verified = false;
            return false;
        }
    }

    r.verified = true;
    return true;
}

/// Dijkstra's shortest paths from source to every reachable node.
///
/// A third argument convertible to the node type selects the single-target
/// overload below instead of being taken as an observer.
///
/// Preconditions:
/// - All edge weights are non-negative (throws std::invalid_argument)
///
/// Example:
/// ```cpp
/// // A->B(4), A->C(2), B->D(5), C->D(8)
/// auto r = dijkstra(g, "A");
/// // r.dist["D"] == 9, reconstruct_path(r, "D") == {"A", "B", "D"}
/// ```
template<weighted_graph_queryable G, typename Observer = null_observer>
    requires (!std::convertible_to<Observer, node_t<G>>)
[[nodiscard]] shortest_path_result<G>
dijkstra(G const& g, node_t<G> const& source, Observer&& obs = {}) {
    require_non_negative_weights(g, "dijkstra");

    shortest_path_result<G> r;
    r.source = source;
    r.dist = graph_traits<G>::template make_node_map<weight_t<G>>(g);
    r.pred = graph_traits<G>::template make_node_map<node_t<G>>(g);
    (void)detail::dijkstra_run(g, r, static_cast<node_t<G> const*>(nullptr), obs);
    (void)verify_shortest_path(g, r);
    return r;
}

/// Dijkstra from source to a single target with early exit.
///
/// Returns the minimal cost and its path, or std::nullopt when target is
/// unreachable.  source == target yields cost 0 and path {source}.
template<weighted_graph_queryable G, typename Observer = null_observer>
[[nodiscard]] std::optional<weighted_path<node_t<G>, weight_t<G>>>
dijkstra(G const& g, node_t<G> const& source, node_t<G> const& target,
         Observer&& obs = {}) {
    require_non_negative_weights(g, "dijkstra");

    shortest_path_result<G> r;
    r.source = source;
    if (!detail::dijkstra_run(g, r, &target, obs)) return std::nullopt;

    return weighted_path<node_t<G>, weight_t<G>>{
        r.dist.at(target),
        detail::walk_predecessors(r.pred, source, target)};
}

/// Sum of arc weights along p.  std::nullopt if p is empty or uses an arc
/// the graph does not have.  A single-node path weighs 0.
template<weighted_graph_queryable G>
[[nodiscard]] std::optional<weight_t<G>>
path_weight(G const& g, path<node_t<G>> const& p) {
    using W = weight_t<G>;
    if (p.empty()) return std::nullopt;

    W total{0};
    for (std::size_t i = 1; i < p.size(); ++i) {
        auto const w = g.edge_weight(p[i - 1], p[i]);
        if (!w) return std::nullopt;
        total = total + *w;
    }
    return total;
}

} // namespace gw::graph

#endif // GW_GRAPH_SHORTEST_PATH_H
