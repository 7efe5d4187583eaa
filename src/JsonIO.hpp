#ifndef JSON_IO_HPP
#define JSON_IO_HPP

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

#include "Graph.hpp"
#include "RiskUpdater.hpp"
#include "RoutePlanner.hpp"

using json = nlohmann::ordered_json; // Preserves insertion order

// Graph input. Throws GraphDataError on a missing field, a wrong type or a
// broken invariant.
Graph graphFromJson(const json& graph_json);
Graph loadGraphFile(const std::string& path);

// Request payloads. Throw InvalidRequestError before anything reaches the core.
RouteQuery routeQueryFromJson(const json& query);
IncidentReport incidentReportFromJson(const json& query);
LngLat pointFromJson(const json& point);
std::string requireString(const json& obj, const char* key);
double requireNumber(const json& obj, const char* key);

json toJson(const LngLat& point);
json toJson(const Node& node);
json toJson(const Edge& edge);
json toJson(const RouteResult& route);
json toJson(const Incident& incident);

std::string formatTimestamp(std::chrono::system_clock::time_point tp);
#endif
