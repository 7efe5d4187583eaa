#include "Engine.hpp"
#include <iostream>

SafeWalkEngine::SafeWalkEngine(Graph graph, const EngineConfig& cfg)
    : config(cfg),
      store(std::move(graph)),
      locator(store, cfg.spatial_index),
      updater(store, incidents, cfg.danger_policy, cfg.blend_weight, cfg.verbose) {}

RouteResult SafeWalkEngine::route(const RouteQuery& query) const {
    auto graph = store.snapshot();
    RouteResult result = RoutePlanner::plan(*graph, query);
    if(config.verbose){
        std::cout << "Route " << query.start << " -> " << query.end
                  << " [" << routeModeName(query.mode) << ", ada=" << (query.ada_required ? "true" : "false") << "]"
                  << ": cost=" << result.total_cost
                  << ", hops=" << result.streets.size()
                  << ", hazards_bypassed=" << result.hazards_bypassed << std::endl;
    }
    return result;
}

RouteResult SafeWalkEngine::routeBetweenPoints(const LngLat& from, const LngLat& to,
                                               RouteMode mode, bool ada_required) const {
    RouteQuery query;
    query.start = locator.nearest(from.lng, from.lat);
    query.end = locator.nearest(to.lng, to.lat);
    query.mode = mode;
    query.ada_required = ada_required;
    return route(query);
}

std::string SafeWalkEngine::nearest(double lng, double lat) const {
    return locator.nearest(lng, lat);
}

IncidentOutcome SafeWalkEngine::reportIncident(const IncidentReport& report){
    IncidentOutcome outcome;
    if(!report.street_id && report.street_name){
        outcome.updated_streets = updater.applyIncidentByStreetName(report, *report.street_name, &outcome.incident);
        return outcome;
    }
    std::optional<std::string> applied = updater.applyIncident(report, &outcome.incident);
    if(applied) outcome.updated_streets.push_back(*applied);
    return outcome;
}

void SafeWalkEngine::resolveIncident(const std::string& incident_id){
    incidents.markResolved(incident_id);
}

std::vector<Incident> SafeWalkEngine::recentIncidents(std::optional<size_t> limit) const {
    return incidents.recent(limit.value_or(config.incident_list_limit));
}

std::vector<Edge> SafeWalkEngine::streets() const {
    return store.streets();
}

std::vector<Edge> SafeWalkEngine::mostDangerousStreets(std::optional<size_t> limit) const {
    return store.mostDangerous(limit.value_or(config.dangerous_streets_limit));
}

void SafeWalkEngine::rebuildSpatialIndex(){
    locator.rebuild();
}
