// examples/graph/example_flight_routes.cpp - Dijkstra and Path Enumeration:
//                                             Flight Booking
//
// Cities are nodes and flights are undirected edges weighted by fare.
// Three questions a booking site answers:
//   1. fewest legs between two cities         (BFS)
//   2. every itinerary within a stop limit    (all_paths with max_edges)
//   3. the cheapest itinerary                 (Dijkstra)
//
// Compile:
//   g++ -std=c++20 -O2 -I include -o example_flight_routes examples/graph/example_flight_routes.cpp

#include <gw/graph/adjacency_graph.h>
#include <gw/graph/path_search.h>
#include <gw/graph/shortest_path.h>

#include <iomanip>
#include <iostream>
#include <string>

using namespace gw::graph;

// =========================================================================
// Flight network (fares in dollars)
// =========================================================================

adjacency_graph<std::string, int> make_flights() {
    auto g = make_undirected<std::string, int>();
    g.add_edge("Mumbai", "Delhi", 80);
    g.add_edge("Mumbai", "Bangalore", 100);
    g.add_edge("Mumbai", "Dubai", 220);
    g.add_edge("Delhi", "Chandigarh", 50);
    g.add_edge("Delhi", "London", 790);
    g.add_edge("Bangalore", "Chennai", 60);
    g.add_edge("Bangalore", "Singapore", 270);
    g.add_edge("Chennai", "Dubai", 240);
    g.add_edge("Chennai", "Singapore", 300);
    g.add_edge("Dubai", "London", 360);
    g.add_edge("London", "New York", 540);
    g.add_edge("Singapore", "New York", 960);
    return g;
}

void print_route(path<std::string> const& p) {
    for (std::size_t i = 0; i < p.size(); ++i) {
        if (i > 0) std::cout << " -> ";
        std::cout << p[i];
    }
}

int main() {
    auto const flights = make_flights();
    std::string const from = "Bangalore";
    std::string const to = "London";

    std::cout << "=== Flight Routes: " << from << " to " << to << " ===\n\n";

    // 1. Fewest legs
    if (auto p = shortest_path(flights, from, to)) {
        std::cout << "Fewest legs (" << p->size() - 1 << "): ";
        print_route(*p);
        std::cout << "\n\n";
    }

    // 2. Every itinerary with at most two stop-overs
    std::size_t const max_legs = 3;
    auto const options = all_paths(flights, from, to, max_legs);
    std::cout << "Itineraries with at most " << max_legs << " legs:\n";
    for (auto const& p : options) {
        std::cout << "  $" << std::setw(5) << std::left << *path_weight(flights, p);
        print_route(p);
        std::cout << "\n";
    }

    // 3. Cheapest overall, no leg limit
    if (auto best = dijkstra(flights, from, to)) {
        std::cout << "\nCheapest fare: $" << best->cost << " via ";
        print_route(best->nodes);
        std::cout << "\n";
    }

    // Fares from the departure city to everywhere.
    auto const all = dijkstra(flights, from);
    std::cout << "\nCheapest fare from " << from << ":\n";
    for (auto const& city : all.settled) {
        std::cout << "  " << std::setw(12) << std::left << city
                  << "$" << all.dist.at(city) << "\n";
    }
    return 0;
}
