#ifndef GRAPH_STORE_HPP
#define GRAPH_STORE_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "Graph.hpp"

// Owns the street network. Readers get an immutable snapshot; a danger
// score change copies the current graph, edits the copy and publishes it,
// so a snapshot never shows a half-applied update.
class GraphStore {
private:
    mutable std::mutex mutex;
    std::shared_ptr<const Graph> current;
    std::atomic<std::uint64_t> mutation_count;

    // Streets ordered by descending danger, rebuilt lazily after a mutation.
    mutable std::vector<Edge> ranking_cache;
    mutable bool ranking_valid;

public:
    explicit GraphStore(Graph graph);

    GraphStore(const GraphStore&) = delete;
    GraphStore& operator=(const GraphStore&) = delete;

    std::shared_ptr<const Graph> snapshot() const;

    // Sets the score to clamp(new_score, 0, 100). Throws NotFoundError.
    void applyDangerDelta(const std::string& street_id, double new_score);

    // Atomic read-modify-write of one score; returns the stored value.
    double updateDangerScore(const std::string& street_id,
                             const std::function<double(double)>& combine);

    Node getNode(const std::string& node_id) const;
    Edge getEdge(const std::string& street_id) const;

    std::vector<Edge> streets() const;
    std::vector<Edge> mostDangerous(size_t limit) const;
    std::vector<std::string> findStreetsByName(const std::string& text) const;

    std::uint64_t version() const { return mutation_count.load(); }
};
#endif
