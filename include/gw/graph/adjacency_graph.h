// graph/representation/adjacency_graph.h - Mutable adjacency-list graph
// Part of the graphwalk graph library (C++20)
//
// DESIGN RATIONALE:
// A hash map from node key to an insertion-ordered vector of outgoing
// (target, weight) arcs, plus a separate vector recording node insertion
// order.  The order vector makes every algorithm deterministic: nodes()
// iterates in first-insertion order and out_neighbors() in arc insertion
// order, so "first inserted neighbour is visited first" holds everywhere.
//
// Undirected graphs store both arcs (u,v) and (v,u).  A self-loop on an
// undirected graph is stored once.
//
// FAILURE POLICY:
// Mutators never throw for redundant or invalid requests.  Duplicate
// nodes, duplicate edges, disallowed self-loops and removal of missing
// entities are no-ops reported by a false return.  add_edge inserts both
// endpoints before any check, so a rejected self-loop still adds its node.
//
// Queries on unknown nodes return empty results, never throw.

#ifndef GW_GRAPH_ADJACENCY_GRAPH_H
#define GW_GRAPH_ADJACENCY_GRAPH_H

#include "graph_concepts.h"
#include "graph_traits.h"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace gw::graph {

/// Whether add_edge(u, v) also connects v to u.
enum class graph_kind { directed, undirected };

/// Structural options fixed at construction.
struct graph_options {
    bool allow_self_loops = false;  // if false, add_edge(u, u) is rejected
};

/// In/out/total degree of a node.
///
/// For undirected graphs in == out == total == number of neighbours.
struct degree_info {
    std::size_t in    = 0;
    std::size_t out   = 0;
    std::size_t total = 0;

    friend bool operator==(degree_info const&, degree_info const&) = default;
};

// =============================================================================
// adjacency_graph<Node, Weight>
// =============================================================================

/// Mutable adjacency-list graph over generic node keys.
///
/// Example:
/// ```cpp
/// adjacency_graph<int> g;
/// g.add_edge(0, 1);
/// g.add_edge(0, 3);
/// g.add_edge(1, 2);
/// auto order = bfs(g, 0);   // {0, 1, 3, 2}
/// ```
template<node_key Node, typename Weight = double>
class adjacency_graph {
public:
    using node_type   = Node;
    using weight_type = Weight;
    using arc_type    = weighted_edge<Node, Weight>;
    using edge_type   = edge<Node, Weight>;

    struct adjacency_range {
        arc_type const* begin_;
        arc_type const* end_;

        [[nodiscard]] arc_type const* begin() const noexcept { return begin_; }
        [[nodiscard]] arc_type const* end() const noexcept { return end_; }
        [[nodiscard]] std::size_t size() const noexcept {
            return static_cast<std::size_t>(end_ - begin_);
        }
        [[nodiscard]] bool empty() const noexcept { return begin_ == end_; }
    };

    explicit adjacency_graph(graph_kind kind = graph_kind::directed,
                             graph_options opts = {})
        : kind_(kind), opts_(opts) {}

    // =========================================================================
    // Size and kind queries
    // =========================================================================

    [[nodiscard]] std::size_t node_count() const noexcept { return order_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return edges_; }
    [[nodiscard]] bool empty() const noexcept { return order_.empty(); }
    [[nodiscard]] graph_kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool directed() const noexcept { return kind_ == graph_kind::directed; }
    [[nodiscard]] graph_options options() const noexcept { return opts_; }

    /// All nodes in first-insertion order.
    [[nodiscard]] std::vector<Node> const& nodes() const noexcept { return order_; }

    [[nodiscard]] bool has_node(Node const& n) const {
        return adj_.find(n) != adj_.end();
    }

    // =========================================================================
    // Mutation
    // =========================================================================

    /// Insert n.  Returns false if it was already present.
    bool add_node(Node const& n) {
        auto [it, inserted] = adj_.try_emplace(n);
        if (inserted) order_.push_back(n);
        return inserted;
    }

    /// Insert arc u->v (and v->u when undirected).  Endpoints are inserted
    /// first, even if the arc is then rejected.  Returns false for a
    /// duplicate arc or a disallowed self-loop.
    bool add_edge(Node const& u, Node const& v, Weight w = Weight{1}) {
        add_node(u);
        add_node(v);
        if (!opts_.allow_self_loops && u == v) return false;
        if (has_edge(u, v)) return false;

        adj_[u].push_back(arc_type{v, w});
        if (!directed() && !(u == v)) {
            adj_[v].push_back(arc_type{u, w});
        }
        ++edges_;
        return true;
    }

    /// Remove arc u->v (and v->u when undirected).  Returns false if absent.
    bool remove_edge(Node const& u, Node const& v) {
        if (!remove_one_arc(u, v)) return false;
        if (!directed() && !(u == v)) {
            remove_one_arc(v, u);
        }
        --edges_;
        return true;
    }

    /// Remove n and every arc that references it.  O(V + E).
    bool remove_node(Node const& n) {
        auto it = adj_.find(n);
        if (it == adj_.end()) return false;

        std::size_t dropped = it->second.size();
        adj_.erase(it);
        order_.erase(std::find(order_.begin(), order_.end(), n));

        std::size_t incoming = 0;
        for (auto& [u, arcs] : adj_) {
            auto const before = arcs.size();
            std::erase_if(arcs, [&](arc_type const& a) { return a.target == n; });
            incoming += before - arcs.size();
        }

        // Undirected: every incoming arc mirrors one of n's own arcs.
        if (directed()) dropped += incoming;
        edges_ -= dropped;
        return true;
    }

    // =========================================================================
    // Adjacency access
    // =========================================================================

    /// Outgoing arcs of u in insertion order.  Empty for an unknown node.
    [[nodiscard]] adjacency_range out_neighbors(Node const& u) const {
        auto it = adj_.find(u);
        if (it == adj_.end() || it->second.empty()) {
            return {nullptr, nullptr};
        }
        auto const& arcs = it->second;
        return {arcs.data(), arcs.data() + arcs.size()};
    }

    /// Neighbour keys of u (targets of its outgoing arcs).
    [[nodiscard]] std::vector<Node> neighbors(Node const& u) const {
        std::vector<Node> out;
        for (auto const& a : out_neighbors(u)) out.push_back(a.target);
        return out;
    }

    /// Nodes with an arc into n, in node order.  O(V + E).
    [[nodiscard]] std::vector<Node> in_neighbors(Node const& n) const {
        std::vector<Node> out;
        for (auto const& u : order_) {
            if (has_edge(u, n)) out.push_back(u);
        }
        return out;
    }

    [[nodiscard]] bool has_edge(Node const& u, Node const& v) const {
        auto it = adj_.find(u);
        if (it == adj_.end()) return false;
        return std::any_of(it->second.begin(), it->second.end(),
                           [&](arc_type const& a) { return a.target == v; });
    }

    [[nodiscard]] std::optional<Weight>
    edge_weight(Node const& u, Node const& v) const {
        for (auto const& a : out_neighbors(u)) {
            if (a.target == v) return a.weight;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::size_t out_degree(Node const& n) const {
        return out_neighbors(n).size();
    }

    [[nodiscard]] std::size_t in_degree(Node const& n) const {
        if (!directed()) return out_degree(n);
        std::size_t d = 0;
        for (auto const& [u, arcs] : adj_) {
            for (auto const& a : arcs) {
                if (a.target == n) ++d;
            }
        }
        return d;
    }

    /// Degree of n.  All zero for an unknown node.
    [[nodiscard]] degree_info degree(Node const& n) const {
        if (!has_node(n)) return {};
        auto const out = out_degree(n);
        if (!directed()) return {out, out, out};
        auto const in = in_degree(n);
        return {in, out, in + out};
    }

    /// All logical edges.  Directed: every arc in node order.  Undirected:
    /// each edge once, oriented from the earlier-inserted endpoint.
    [[nodiscard]] std::vector<edge_type> edges() const {
        std::vector<edge_type> out;
        out.reserve(edges_);

        std::unordered_map<Node, std::size_t> position;
        if (!directed()) {
            for (std::size_t i = 0; i < order_.size(); ++i) {
                position.emplace(order_[i], i);
            }
        }

        for (auto const& u : order_) {
            for (auto const& a : out_neighbors(u)) {
                if (!directed() && position.at(a.target) < position.at(u)) {
                    continue;
                }
                out.push_back(edge_type{u, a.target, a.weight});
            }
        }
        return out;
    }

private:
    graph_kind kind_;
    graph_options opts_;
    std::unordered_map<Node, std::vector<arc_type>> adj_;
    std::vector<Node> order_;
    std::size_t edges_ = 0;

    bool remove_one_arc(Node const& u, Node const& v) {
        auto it = adj_.find(u);
        if (it == adj_.end()) return false;
        auto& arcs = it->second;
        auto pos = std::find_if(arcs.begin(), arcs.end(),
                                [&](arc_type const& a) { return a.target == v; });
        if (pos == arcs.end()) return false;
        arcs.erase(pos);
        return true;
    }
};

// Verify concept satisfaction.
static_assert(graph_queryable<adjacency_graph<int>>);
static_assert(weighted_graph_queryable<adjacency_graph<int, double>>);

// =============================================================================
// graph_traits specialisation for adjacency_graph
// =============================================================================

template<node_key Node, typename Weight>
struct graph_traits<adjacency_graph<Node, Weight>> {
    using node_type   = Node;
    using weight_type = Weight;

    template<typename T>
    using node_map = std::unordered_map<Node, T>;

    using node_set = std::unordered_set<Node>;

    template<typename T>
    static node_map<T> make_node_map(adjacency_graph<Node, Weight> const& g) {
        node_map<T> m;
        m.reserve(g.node_count());
        return m;
    }

    static node_set make_node_set(adjacency_graph<Node, Weight> const& g) {
        node_set s;
        s.reserve(g.node_count());
        return s;
    }
};

/// Undirected graph convenience factory.
template<node_key Node, typename Weight = double>
[[nodiscard]] adjacency_graph<Node, Weight>
make_undirected(graph_options opts = {}) {
    return adjacency_graph<Node, Weight>{graph_kind::undirected, opts};
}

} // namespace gw::graph

#endif // GW_GRAPH_ADJACENCY_GRAPH_H
