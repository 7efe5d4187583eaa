#ifndef ROUTE_PLANNER_HPP
#define ROUTE_PLANNER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "Graph.hpp"

enum class RouteMode { Safest, Shortest };

const char* routeModeName(RouteMode mode);
// Throws InvalidRequestError for anything but "safest" / "shortest".
RouteMode parseRouteMode(const std::string& name);

struct RouteQuery {
    std::string start;
    std::string end;
    RouteMode mode;
    bool ada_required;

    RouteQuery() : mode(RouteMode::Safest), ada_required(false) {}
};

struct RouteResult {
    std::vector<std::string> path;    // intersection ids, start to end
    std::vector<std::string> streets; // street ids, one per hop
    std::vector<LngLat> coordinates;
    double total_cost;
    double total_distance_m;
    double total_danger;
    RouteMode mode;
    bool ada_required;
    int hazards_bypassed; // streets dropped by the ADA filter

    RouteResult() : total_cost(0), total_distance_m(0), total_danger(0),
                    mode(RouteMode::Safest), ada_required(false), hazards_bypassed(0) {}
};

class RoutePlanner {
private:
    struct QueueEntry {
        double cost;
        std::uint64_t order; // push sequence, keeps equal costs first-in first-out
        std::string node;

        bool operator>(const QueueEntry& other) const {
            if(cost != other.cost) return cost > other.cost;
            return order > other.order;
        }
    };

    static double edgeCost(const Edge& edge, RouteMode mode);
    static void appendStreetGeometry(std::vector<LngLat>& coordinates, const Edge& edge, const Node& from);

public:
    // Consecutive street geometries whose touching ends are closer than
    // this are joined without repeating the shared point.
    static constexpr double SHARED_ENDPOINT_TOLERANCE_M = 0.5;

    // Dijkstra over one snapshot. Throws EmptyGraphError, NotFoundError or
    // UnreachableError; never returns a partial route.
    static RouteResult plan(const Graph& graph, const RouteQuery& query);

    static int countInaccessible(const Graph& graph);
};
#endif
