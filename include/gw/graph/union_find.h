// graph/algorithms/union_find.h - Disjoint-set forest over generic node keys
// Part of the graphwalk graph library (C++20)
//
// ALGORITHM: Union-Find with path compression and union by rank.
// Complexity: O(alpha(n)) amortised per find / unite.
//
// DESIGN RATIONALE:
// find is iterative two-pass compression: one walk to locate the root, a
// second walk re-pointing every node on the way at that root.  No
// recursion, so arbitrarily deep trees (before compression) are safe.
//
// Keys are hashed, not indexed, so the structure works directly on the
// graph's own node type.  Unknown keys passed to find / unite are added
// on demand as singleton sets.
//
// Insertion order is recorded so that groups() is deterministic.

#ifndef GW_GRAPH_UNION_FIND_H
#define GW_GRAPH_UNION_FIND_H

#include "graph_concepts.h"

#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gw::graph {

/// Disjoint-set forest keyed by Node.
///
/// Example:
/// ```cpp
/// disjoint_set<int> ds;
/// ds.unite(0, 1);
/// ds.unite(2, 3);
/// ds.connected(0, 1);   // true
/// ds.connected(1, 2);   // false
/// ds.set_count();       // 2
/// ```
template<node_key Node>
class disjoint_set {
public:
    disjoint_set() = default;

    /// Construct with every node in its own singleton set.
    template<typename Range>
    explicit disjoint_set(Range const& nodes) {
        for (auto const& n : nodes) add(n);
    }

    /// Insert n as a singleton set.  Returns false if already present.
    bool add(Node const& n) {
        auto [it, inserted] = parent_.try_emplace(n, n);
        if (!inserted) return false;
        rank_.emplace(n, 0);
        order_.push_back(n);
        ++sets_;
        return true;
    }

    [[nodiscard]] bool contains(Node const& n) const {
        return parent_.find(n) != parent_.end();
    }

    /// Representative of n's set, compressing the path walked.
    Node find(Node const& n) {
        add(n);

        Node root = n;
        for (;;) {
            auto const& p = parent_.at(root);
            if (p == root) break;
            root = p;
        }

        Node x = n;
        while (!(x == root)) {
            auto& p = parent_.at(x);
            Node next = p;
            p = root;
            x = std::move(next);
        }
        return root;
    }

    /// Merge the sets of a and b.  Returns false if they were already one
    /// set (no structural change).
    bool unite(Node const& a, Node const& b) {
        Node ra = find(a);
        Node rb = find(b);
        if (ra == rb) return false;

        auto& rank_a = rank_.at(ra);
        auto& rank_b = rank_.at(rb);
        if (rank_a < rank_b) {
            parent_.at(ra) = rb;
        } else if (rank_a > rank_b) {
            parent_.at(rb) = ra;
        } else {
            parent_.at(rb) = ra;
            ++rank_a;
        }
        --sets_;
        return true;
    }

    /// True if a and b are in the same set.  Unknown nodes are never
    /// connected to anything but themselves.
    [[nodiscard]] bool connected(Node const& a, Node const& b) {
        if (!contains(a) || !contains(b)) return a == b;
        return find(a) == find(b);
    }

    /// Number of disjoint sets.
    [[nodiscard]] std::size_t set_count() const noexcept { return sets_; }

    /// Number of elements.
    [[nodiscard]] std::size_t size() const noexcept { return order_.size(); }

    /// Every set as a member list.  Sets are ordered by their first
    /// inserted member and members by insertion order.
    [[nodiscard]] std::vector<std::vector<Node>> groups() {
        std::vector<std::vector<Node>> out;
        std::unordered_map<Node, std::size_t> slot;
        slot.reserve(sets_);

        for (auto const& n : order_) {
            auto [it, inserted] = slot.try_emplace(find(n), out.size());
            if (inserted) out.emplace_back();
            out[it->second].push_back(n);
        }
        return out;
    }

private:
    std::unordered_map<Node, Node> parent_;
    std::unordered_map<Node, std::size_t> rank_;
    std::vector<Node> order_;
    std::size_t sets_ = 0;
};

} // namespace gw::graph

#endif // GW_GRAPH_UNION_FIND_H
