// graph/observer.h - Checkpoint hooks for step-by-step narration
// Part of the graphwalk graph library (C++20)
//
// DESIGN RATIONALE:
// Algorithms never print.  Callers that want to narrate a run (teaching
// demos, tests asserting on intermediate state) pass an observer whose
// member functions are invoked at fixed checkpoints.  The hooks are
// resolved statically, so the default null_observer compiles away.
//
// To observe a subset of checkpoints, derive from null_observer and
// declare only the hooks of interest; the rest stay no-ops.
//
// CHECKPOINTS:
//   discover(n)          n entered the frontier (BFS enqueue, DFS entry);
//                        fired once per node
//   visit(n)             n was finalised (dequeued / popped / settled)
//   examine(u, v, w)     arc u->v is being considered
//   relax(u, v, d)       distance to v improved to d through u (Dijkstra)
//   backtrack(n)         DFS finished n and returned to its parent
//   back_edge(u, v)      arc u->v closes a cycle

#ifndef GW_GRAPH_OBSERVER_H
#define GW_GRAPH_OBSERVER_H

namespace gw::graph {

/// Observer that ignores every checkpoint.
struct null_observer {
    template<typename N>
    void discover(N const&) {}

    template<typename N>
    void visit(N const&) {}

    template<typename N, typename W>
    void examine(N const&, N const&, W const&) {}

    template<typename N, typename W>
    void relax(N const&, N const&, W const&) {}

    template<typename N>
    void backtrack(N const&) {}

    template<typename N>
    void back_edge(N const&, N const&) {}
};

} // namespace gw::graph

#endif // GW_GRAPH_OBSERVER_H
