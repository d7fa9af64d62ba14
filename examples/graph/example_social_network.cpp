// examples/graph/example_social_network.cpp - BFS and Components: Friendship
//                                              Graph Analysis
//
// Users are nodes, friendships are undirected edges.  The library answers
// the structural questions; the example adds the small amount of glue
// (set intersection, sorting by degree) a real service would.
//
//   degrees of separation   shortest_path hop count
//   friend suggestions      bfs_within(user, 2) minus direct friends
//   communities             connected_components
//
// Compile:
//   g++ -std=c++20 -O2 -I include -o example_social_network examples/graph/example_social_network.cpp

#include <gw/graph/adjacency_graph.h>
#include <gw/graph/connected_components.h>
#include <gw/graph/shortest_path.h>
#include <gw/graph/traversal.h>

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace gw::graph;

using friend_graph = adjacency_graph<std::string>;

friend_graph make_network() {
    auto g = make_undirected<std::string>();
    g.add_edge("Alice", "Bob");
    g.add_edge("Alice", "Carol");
    g.add_edge("Bob", "Dave");
    g.add_edge("Carol", "Dave");
    g.add_edge("Carol", "Eve");
    g.add_edge("Dave", "Frank");
    g.add_edge("Eve", "Grace");
    // A separate circle of friends
    g.add_edge("Heidi", "Ivan");
    g.add_edge("Ivan", "Judy");
    g.add_node("Mallory");
    return g;
}

std::vector<std::string> mutual_friends(friend_graph const& g,
                                        std::string const& a,
                                        std::string const& b) {
    std::vector<std::string> out;
    for (auto const& f : g.neighbors(a)) {
        if (g.has_edge(b, f)) out.push_back(f);
    }
    return out;
}

std::vector<std::string> suggestions(friend_graph const& g, std::string const& user) {
    std::vector<std::string> out;
    for (auto const& n : bfs_within(g, user, 2)) {
        if (!g.has_edge(user, n)) out.push_back(n);
    }
    return out;
}

void print_list(std::vector<std::string> const& names) {
    std::cout << "[";
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) std::cout << ", ";
        std::cout << names[i];
    }
    std::cout << "]";
}

int main() {
    auto const g = make_network();

    std::cout << "=== Social Network Analysis ===\n\n";
    std::cout << g.node_count() << " users, " << g.edge_count() << " friendships\n\n";

    // Degrees of separation
    std::pair<char const*, char const*> const pairs[] = {
        {"Alice", "Frank"}, {"Bob", "Grace"}, {"Alice", "Judy"}};
    std::cout << "Degrees of separation:\n";
    for (auto const& [a, b] : pairs) {
        std::cout << "  " << a << " -> " << b << ": ";
        if (auto p = shortest_path(g, a, b)) {
            std::cout << p->size() - 1 << "  ";
            print_list(*p);
        } else {
            std::cout << "not connected";
        }
        std::cout << "\n";
    }

    std::cout << "\nMutual friends of Bob and Carol: ";
    print_list(mutual_friends(g, "Bob", "Carol"));
    std::cout << "\nPeople Alice may know: ";
    print_list(suggestions(g, "Alice"));
    std::cout << "\n";

    // Most connected users
    auto ranked = g.nodes();
    std::stable_sort(ranked.begin(), ranked.end(),
                     [&](std::string const& x, std::string const& y) {
                         return g.degree(x).total > g.degree(y).total;
                     });
    std::cout << "\nMost connected:\n";
    for (std::size_t i = 0; i < 3 && i < ranked.size(); ++i) {
        std::cout << "  " << ranked[i] << " (" << g.degree(ranked[i]).total << " friends)\n";
    }

    // Friend circles
    auto const circles = connected_components(g, component_method::union_find);
    std::cout << "\nFriend circles: " << circles.count() << "\n";
    for (std::size_t i = 0; i < circles.count(); ++i) {
        std::cout << "  " << i + 1 << ". ";
        print_list(circles.components[i]);
        std::cout << "\n";
    }
    std::cout << "Everyone connected: " << (is_connected(g) ? "yes" : "no") << "\n";
    return 0;
}
