#include "GraphStore.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>

static std::string toLower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

GraphStore::GraphStore(Graph graph)
    : current(std::make_shared<const Graph>(std::move(graph))),
      mutation_count(0),
      ranking_valid(false) {}

std::shared_ptr<const Graph> GraphStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return current;
}

void GraphStore::applyDangerDelta(const std::string& street_id, double new_score){
    updateDangerScore(street_id, [new_score](double){ return new_score; });
}

double GraphStore::updateDangerScore(const std::string& street_id,
                                     const std::function<double(double)>& combine){
    std::lock_guard<std::mutex> lock(mutex);
    const Edge* e = current->getEdge(street_id);
    if(!e){
        throw NotFoundError("street '" + street_id + "' not found");
    }
    double score = clampDanger(combine(e->danger_score));

    auto next = std::make_shared<Graph>(*current);
    next->setDangerScore(street_id, score);
    current = std::move(next);

    ranking_valid = false;
    ++mutation_count;
    return score;
}

Node GraphStore::getNode(const std::string& node_id) const {
    auto graph = snapshot();
    const Node* n = graph->getNode(node_id);
    if(!n){
        throw NotFoundError("intersection '" + node_id + "' not found");
    }
    return *n;
}

Edge GraphStore::getEdge(const std::string& street_id) const {
    auto graph = snapshot();
    const Edge* e = graph->getEdge(street_id);
    if(!e){
        throw NotFoundError("street '" + street_id + "' not found");
    }
    return *e;
}

std::vector<Edge> GraphStore::streets() const {
    return snapshot()->getEdges();
}

std::vector<Edge> GraphStore::mostDangerous(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex);
    if(!ranking_valid){
        ranking_cache = current->getEdges();
        std::stable_sort(ranking_cache.begin(), ranking_cache.end(),
                         [](const Edge& a, const Edge& b){
                             if(a.danger_score != b.danger_score) return a.danger_score > b.danger_score;
                             return a.id < b.id;
                         });
        ranking_valid = true;
    }
    size_t n = std::min(limit, ranking_cache.size());
    return std::vector<Edge>(ranking_cache.begin(), ranking_cache.begin() + n);
}

std::vector<std::string> GraphStore::findStreetsByName(const std::string& text) const {
    std::vector<std::string> ids;
    std::string needle = toLower(text);
    if(needle.empty()) return ids;

    auto graph = snapshot();
    for(const Edge& e : graph->getEdges()){
        if(toLower(e.name).find(needle) != std::string::npos){
            ids.push_back(e.id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}
