#ifndef ENGINE_HPP
#define ENGINE_HPP

#include <optional>
#include <string>
#include <vector>

#include "Config.hpp"
#include "Graph.hpp"
#include "GraphStore.hpp"
#include "RiskUpdater.hpp"
#include "RoutePlanner.hpp"
#include "SpatialIndex.hpp"

struct IncidentOutcome {
    Incident incident;
    std::vector<std::string> updated_streets;
};

// Entry point for the request layer. Safe to call from several threads:
// routes read a snapshot, incidents go through the store's single writer.
class SafeWalkEngine {
private:
    EngineConfig config;
    GraphStore store;
    NearestNodeLocator locator;
    IncidentLog incidents;
    RiskUpdater updater;

public:
    explicit SafeWalkEngine(Graph graph, const EngineConfig& cfg = EngineConfig());

    RouteResult route(const RouteQuery& query) const;
    RouteResult routeBetweenPoints(const LngLat& from, const LngLat& to,
                                   RouteMode mode, bool ada_required) const;
    std::string nearest(double lng, double lat) const;

    // Uses street_id when present, otherwise resolves street_name; a report
    // naming neither is recorded without touching the graph.
    IncidentOutcome reportIncident(const IncidentReport& report);
    void resolveIncident(const std::string& incident_id);
    std::vector<Incident> recentIncidents(std::optional<size_t> limit = std::nullopt) const;

    std::vector<Edge> streets() const;
    std::vector<Edge> mostDangerousStreets(std::optional<size_t> limit = std::nullopt) const;
    void rebuildSpatialIndex();

    const GraphStore& graphStore() const { return store; }
    GraphStore& graphStore() { return store; }
    const EngineConfig& getConfig() const { return config; }
};
#endif
