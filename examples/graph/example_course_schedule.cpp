// examples/graph/example_course_schedule.cpp - Topological Sort: Course
//                                               Prerequisites
//
// An arc u -> v means course u must be taken before course v.  A valid
// schedule is a topological order.  Adding a circular prerequisite makes
// scheduling impossible, and both sort variants report the courses stuck
// behind the cycle instead of a partial plan.
//
// Compile:
//   g++ -std=c++20 -O2 -I include -o example_course_schedule examples/graph/example_course_schedule.cpp

#include <gw/graph/adjacency_graph.h>
#include <gw/graph/cycle_detection.h>
#include <gw/graph/topological_sort.h>

#include <iostream>
#include <string>
#include <vector>

using namespace gw::graph;

// =========================================================================
// Curriculum
// =========================================================================
//
//   intro_programming -> data_structures -> algorithms -> compilers
//   discrete_math     -> algorithms
//   discrete_math     -> theory_of_computation -> compilers
//   linear_algebra    -> machine_learning
//   algorithms        -> machine_learning

adjacency_graph<std::string> make_curriculum() {
    adjacency_graph<std::string> g;
    g.add_edge("intro_programming", "data_structures");
    g.add_edge("data_structures", "algorithms");
    g.add_edge("discrete_math", "algorithms");
    g.add_edge("discrete_math", "theory_of_computation");
    g.add_edge("algorithms", "compilers");
    g.add_edge("theory_of_computation", "compilers");
    g.add_edge("linear_algebra", "machine_learning");
    g.add_edge("algorithms", "machine_learning");
    return g;
}

void print_schedule(std::vector<std::string> const& order) {
    for (std::size_t i = 0; i < order.size(); ++i) {
        std::cout << "  " << (i + 1) << ". " << order[i] << "\n";
    }
}

int main() {
    auto g = make_curriculum();

    std::cout << "=== Course Scheduling: Topological Sort ===\n\n";
    std::cout << "Prerequisites:\n";
    for (auto const& e : g.edges()) {
        std::cout << "  " << e.from << " -> " << e.to << "\n";
    }

    auto const kahn = topological_sort(g);
    std::cout << "\nSchedule (Kahn, queue order):\n";
    print_schedule(kahn.order);
    std::cout << "Valid: " << (is_valid_topological_order(g, kahn.order) ? "yes" : "no") << "\n";

    auto const post = topological_sort_dfs(g);
    std::cout << "\nSchedule (DFS post-order):\n";
    print_schedule(post.order);

    // A mistaken prerequisite closes a loop.
    g.add_edge("compilers", "data_structures");
    std::cout << "\nAdded compilers -> data_structures\n";

    auto const broken = topological_sort(g);
    std::cout << "Schedulable: " << (broken.is_dag ? "yes" : "no") << "\n";
    std::cout << "Courses that can never be taken:\n";
    print_schedule(broken.cyclic_nodes);

    if (auto const c = find_cycle_directed(g)) {
        std::cout << "Circular requirement: ";
        for (std::size_t i = 0; i < c.cycle.size(); ++i) {
            if (i > 0) std::cout << " -> ";
            std::cout << c.cycle[i];
        }
        std::cout << "\n";
    }
    return 0;
}
