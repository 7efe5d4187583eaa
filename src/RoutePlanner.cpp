#include "RoutePlanner.hpp"
#include "Errors.hpp"
#include <queue>
#include <algorithm>
#include <unordered_map>

const char* routeModeName(RouteMode mode){
    return mode == RouteMode::Safest ? "safest" : "shortest";
}

RouteMode parseRouteMode(const std::string& name){
    if(name == "safest") return RouteMode::Safest;
    if(name == "shortest") return RouteMode::Shortest;
    throw InvalidRequestError("unknown routing mode '" + name + "' (expected safest or shortest)");
}

double RoutePlanner::edgeCost(const Edge& edge, RouteMode mode){
    return mode == RouteMode::Safest ? edge.danger_score : edge.distance_m;
}

int RoutePlanner::countInaccessible(const Graph& graph){
    int count = 0;
    for(const Edge& e : graph.getEdges()){
        if(!e.accessible) ++count;
    }
    return count;
}

void RoutePlanner::appendStreetGeometry(std::vector<LngLat>& coordinates, const Edge& edge, const Node& from){
    std::vector<LngLat> segment = edge.geometry;
    if(segment.empty()) return;

    // Stored geometry may run either way; start it at the end we are leaving from.
    const LngLat origin = from.position();
    if(Geo::haversineDistance(segment.back(), origin) < Geo::haversineDistance(segment.front(), origin)){
        std::reverse(segment.begin(), segment.end());
    }

    size_t first = 0;
    if(!coordinates.empty() &&
       Geo::haversineDistance(coordinates.back(), segment.front()) <= SHARED_ENDPOINT_TOLERANCE_M){
        first = 1;
    }
    coordinates.insert(coordinates.end(), segment.begin() + first, segment.end());
}

RouteResult RoutePlanner::plan(const Graph& graph, const RouteQuery& query){
    if(graph.empty()){
        throw EmptyGraphError("no intersections loaded");
    }
    const Node* src_node = graph.getNode(query.start);
    if(!src_node){
        throw NotFoundError("start intersection '" + query.start + "' not found");
    }
    const Node* dst_node = graph.getNode(query.end);
    if(!dst_node){
        throw NotFoundError("end intersection '" + query.end + "' not found");
    }

    std::unordered_map<std::string, double> dist;
    std::unordered_map<std::string, std::string> parent;
    std::unordered_map<std::string, size_t> parent_edge;
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, std::greater<QueueEntry>> pq;
    std::uint64_t pushes = 0;

    dist[query.start] = 0.0;
    pq.push({0.0, pushes++, query.start});

    while(!pq.empty()){
        QueueEntry top = pq.top();
        pq.pop();
        const std::string& u = top.node;

        if(top.cost > dist[u]) continue;
        if(u == query.end) break;

        for(size_t edge_index : graph.getAdjacentEdges(u)){
            const Edge& e = graph.edgeAt(edge_index);
            if(query.ada_required && !e.accessible) continue;
            // One-way streets only leave from their start intersection.
            if(!e.bidirectional && e.u != u) continue;

            const std::string& v = e.other(u);
            double new_cost = top.cost + edgeCost(e, query.mode);

            auto it = dist.find(v);
            if(it == dist.end() || new_cost + 1e-9 < it->second){
                dist[v] = new_cost;
                parent[v] = u;
                parent_edge[v] = edge_index;
                pq.push({new_cost, pushes++, v});
            }
        }
    }

    if(!dist.count(query.end)){
        throw UnreachableError("no route from '" + query.start + "' to '" + query.end + "'" +
                               (query.ada_required ? " using accessible streets only" : ""));
    }

    RouteResult result;
    result.mode = query.mode;
    result.ada_required = query.ada_required;
    result.hazards_bypassed = query.ada_required ? countInaccessible(graph) : 0;
    result.total_cost = dist[query.end];

    std::string cur = query.end;
    while(cur != query.start){
        result.path.push_back(cur);
        size_t edge_index = parent_edge[cur];
        result.streets.push_back(graph.edgeAt(edge_index).id);
        cur = parent[cur];
    }
    result.path.push_back(query.start);
    std::reverse(result.path.begin(), result.path.end());
    std::reverse(result.streets.begin(), result.streets.end());

    result.coordinates.push_back(src_node->position());
    for(size_t i = 0; i < result.streets.size(); ++i){
        const Edge* e = graph.getEdge(result.streets[i]);
        const Node* from = graph.getNode(result.path[i]);
        result.total_distance_m += e->distance_m;
        result.total_danger += e->danger_score;
        appendStreetGeometry(result.coordinates, *e, *from);
    }
    return result;
}
