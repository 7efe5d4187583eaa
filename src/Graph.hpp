#ifndef GRAPH_HPP
#define GRAPH_HPP

#include <vector>
#include <string>
#include <unordered_map>
#include <limits>

#include "Geometry.hpp"

const double INF = std::numeric_limits<double>::infinity();

constexpr double MIN_DANGER = 0.0;
constexpr double MAX_DANGER = 100.0;

double clampDanger(double score);

struct Node {
    std::string id;
    std::string name;
    double lng;
    double lat;
    std::vector<std::string> tags; // "lit", "crosswalk", ...

    Node() : lng(0), lat(0) {}

    LngLat position() const { return {lng, lat}; }
};

struct Edge {
    std::string id;
    std::string name;
    std::string u; // start intersection
    std::string v; // end intersection
    std::vector<LngLat> geometry;
    double distance_m;
    double danger_score;
    bool accessible;
    bool bidirectional;

    Edge() : distance_m(0), danger_score(0), accessible(true), bidirectional(true) {}

    const std::string& other(const std::string& node_id) const { return (u == node_id) ? v : u; }
};

// Plain value type: copying a Graph copies the whole street network.
// GraphStore relies on that to publish immutable snapshots.
class Graph {
private:
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    std::unordered_map<std::string, size_t> node_id_to_index;
    std::unordered_map<std::string, size_t> edge_id_to_index;
    std::unordered_map<std::string, std::vector<size_t>> adj_list; // node id -> edge indices

public:
    void addNode(const Node& node);
    void addEdge(const Edge& edge);
    void setDangerScore(const std::string& edge_id, double score);

    const Node* getNode(const std::string& node_id) const;
    const Edge* getEdge(const std::string& edge_id) const;
    const std::vector<size_t>& getAdjacentEdges(const std::string& node_id) const;
    const Edge& edgeAt(size_t index) const { return edges[index]; }

    size_t getNodeCount() const { return nodes.size(); }
    size_t getEdgeCount() const { return edges.size(); }
    bool empty() const { return nodes.empty(); }
    const std::vector<Node>& getNodes() const { return nodes; }
    const std::vector<Edge>& getEdges() const { return edges; }
};
#endif
