#include "Graph.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cmath>

double clampDanger(double score){
    if(std::isnan(score)) return MIN_DANGER;
    return std::min(MAX_DANGER, std::max(MIN_DANGER, score));
}

void Graph::addNode(const Node& node){
    if(node.id.empty()){
        throw GraphDataError("intersection without an id");
    }
    if(node_id_to_index.count(node.id)){
        throw GraphDataError("duplicate intersection id '" + node.id + "'");
    }
    if(!Geo::isValidCoordinate(node.lng, node.lat)){
        throw GraphDataError("intersection '" + node.id + "' has an invalid position");
    }
    node_id_to_index[node.id] = nodes.size();
    nodes.push_back(node);
    adj_list[node.id] = std::vector<size_t>();
}

void Graph::addEdge(const Edge& edge){
    if(edge.id.empty()){
        throw GraphDataError("street without an id");
    }
    if(edge_id_to_index.count(edge.id)){
        throw GraphDataError("duplicate street id '" + edge.id + "'");
    }
    const Node* start = getNode(edge.u);
    const Node* end = getNode(edge.v);
    if(!start || !end){
        throw GraphDataError("street '" + edge.id + "' references an unknown intersection");
    }
    if(!std::isfinite(edge.distance_m) || edge.distance_m < 0){
        throw GraphDataError("street '" + edge.id + "' has a negative or non-finite distance");
    }
    if(!(edge.danger_score >= MIN_DANGER && edge.danger_score <= MAX_DANGER)){
        throw GraphDataError("street '" + edge.id + "' has a danger score outside [0, 100]");
    }

    size_t index = edges.size();
    edge_id_to_index[edge.id] = index;
    edges.push_back(edge);
    if(edges.back().geometry.size() < 2){
        edges.back().geometry = {start->position(), end->position()};
    }

    adj_list[edge.u].push_back(index);
    if(edge.bidirectional && edge.u != edge.v){
        adj_list[edge.v].push_back(index);
    }
}

void Graph::setDangerScore(const std::string& edge_id, double score){
    auto it = edge_id_to_index.find(edge_id);
    if(it == edge_id_to_index.end()){
        throw NotFoundError("street '" + edge_id + "' not found");
    }
    edges[it->second].danger_score = clampDanger(score);
}

const Node* Graph::getNode(const std::string& node_id) const{
    auto idx = node_id_to_index.find(node_id);
    if(idx != node_id_to_index.end()){
        return &nodes[idx->second];
    }
    return nullptr;
}

const Edge* Graph::getEdge(const std::string& edge_id) const {
    auto edg = edge_id_to_index.find(edge_id);
    if(edg != edge_id_to_index.end()){
        return &edges[edg->second];
    }
    return nullptr;
}

const std::vector<size_t>& Graph::getAdjacentEdges(const std::string& node_id) const{
    static const std::vector<size_t> no_edges;
    auto ad = adj_list.find(node_id);
    if(ad != adj_list.end()){
        return ad->second;
    }
    return no_edges;
}
