#include <iostream>
#include <fstream>
#include <chrono>
#include <string>
#include <vector>

#include "Config.hpp"
#include "Engine.hpp"
#include "Errors.hpp"
#include "JsonIO.hpp"

static const json& requireObject(const json& query, const char* key){
    if(!query.contains(key) || (!query[key].is_object() && !query[key].is_array())){
        throw InvalidRequestError(std::string("field '") + key + "' must be a point");
    }
    return query[key];
}

static size_t optionalLimit(const json& query, size_t fallback){
    if(!query.contains("limit")) return fallback;
    if(!query["limit"].is_number_unsigned()){
        throw InvalidRequestError("field 'limit' must be a non-negative integer");
    }
    return query["limit"].get<size_t>();
}

static void copyFields(json& response, const json& fields){
    for(auto it = fields.begin(); it != fields.end(); ++it){
        response[it.key()] = it.value();
    }
}

// --- Helper function to handle individual queries ---
json process_query(SafeWalkEngine& engine, const json& query) {
    if (!query.is_object() || !query.contains("type") || !query["type"].is_string()) {
        throw InvalidRequestError("query needs a string 'type'");
    }
    std::string type = query["type"].get<std::string>();

    json response;
    if (query.contains("id")) response["id"] = query["id"];

    if (type == "route") {
        RouteQuery route_query = routeQueryFromJson(query);
        RouteResult result = engine.route(route_query);
        response["possible"] = true;
        copyFields(response, toJson(result));

    } else if (type == "route_points") {
        LngLat from = pointFromJson(requireObject(query, "from"));
        LngLat to = pointFromJson(requireObject(query, "to"));
        RouteMode mode = RouteMode::Safest;
        if (query.contains("mode")) {
            if (!query["mode"].is_string()) throw InvalidRequestError("field 'mode' must be a string");
            mode = parseRouteMode(query["mode"].get<std::string>());
        }
        bool ada = query.value("ada_required", false);
        RouteResult result = engine.routeBetweenPoints(from, to, mode, ada);
        response["possible"] = true;
        copyFields(response, toJson(result));

    } else if (type == "nearest") {
        LngLat point = query.contains("point") ? pointFromJson(requireObject(query, "point"))
                                               : pointFromJson(query);
        std::string node_id = engine.nearest(point.lng, point.lat);
        response["node"] = toJson(engine.graphStore().getNode(node_id));

    } else if (type == "incident") {
        IncidentOutcome outcome = engine.reportIncident(incidentReportFromJson(query));
        response["incident"] = toJson(outcome.incident);
        response["updated_streets"] = outcome.updated_streets;

    } else if (type == "resolve_incident") {
        engine.resolveIncident(requireString(query, "incident_id"));
        response["done"] = true;

    } else if (type == "incidents") {
        json list = json::array();
        for (const Incident& incident : engine.recentIncidents(optionalLimit(query, engine.getConfig().incident_list_limit))) {
            list.push_back(toJson(incident));
        }
        response["incidents"] = list;

    } else if (type == "streets") {
        json list = json::array();
        for (const Edge& edge : engine.streets()) list.push_back(toJson(edge));
        response["streets"] = list;

    } else if (type == "dangerous_streets") {
        json list = json::array();
        for (const Edge& edge : engine.mostDangerousStreets(optionalLimit(query, engine.getConfig().dangerous_streets_limit))) {
            list.push_back(toJson(edge));
        }
        response["streets"] = list;

    } else if (type == "rebuild_index") {
        engine.rebuildSpatialIndex();
        response["done"] = true;

    } else {
        throw InvalidRequestError("unknown query type '" + type + "'");
    }

    return response;
}

static json error_response(const json& query, const char* kind, const std::string& message) {
    json response;
    if (query.is_object() && query.contains("id")) response["id"] = query["id"];
    response["possible"] = false;
    response["error"] = kind;
    response["message"] = message;
    return response;
}

int main(int argc, char* argv[]) {
    if (argc != 4 && argc != 5) {
        std::cerr << "Usage: " << argv[0] << " <graph.json> <queries.json> <output.json> [config.json]" << std::endl;
        return 1;
    }

    std::string graph_path = argv[1];
    std::string queries_path = argv[2];
    std::string output_path = argv[3];

    // 1. Configuration and graph
    EngineConfig config;
    Graph graph;
    try {
        if (argc == 5) config = loadEngineConfig(argv[4]);
        graph = loadGraphFile(graph_path);
    } catch (const std::exception& e) {
        std::cerr << "Startup failed: " << e.what() << std::endl;
        return 1;
    }
    if (graph.empty()) {
        std::cerr << "Graph " << graph_path << " has no intersections" << std::endl;
        return 1;
    }
    std::cout << "Loaded " << graph.getNodeCount() << " intersections and "
              << graph.getEdgeCount() << " streets" << std::endl;

    SafeWalkEngine engine(std::move(graph), config);

    // 2. Read queries
    std::ifstream queries_file(queries_path);
    if (!queries_file.is_open()) {
        std::cerr << "Failed to open queries file: " << queries_path << std::endl;
        return 1;
    }
    json queries_json;
    try {
        queries_file >> queries_json;
    } catch (const json::exception& e) {
        std::cerr << "Failed to parse queries file: " << e.what() << std::endl;
        return 1;
    }
    queries_file.close();

    std::ofstream output_file(output_path);
    if (!output_file.is_open()) {
        std::cerr << "Failed to open output file: " << output_path << std::endl;
        return 1;
    }

    json final_output;
    if (queries_json.is_object() && queries_json.contains("meta")) {
        final_output["meta"] = queries_json["meta"];
    }
    json results_array = json::array();

    // 3. Determine Query List
    const json* queries_list = nullptr;
    if (queries_json.is_array()) queries_list = &queries_json;
    else if (queries_json.contains("events")) queries_list = &queries_json["events"];
    else if (queries_json.contains("queries")) queries_list = &queries_json["queries"];

    if (queries_list == nullptr || !queries_list->is_array()) {
        std::cerr << "Error: Could not find valid query array." << std::endl;
        return 1;
    }

    // 4. Process
    int failures = 0;
    for (const auto& query : *queries_list) {
        auto start_time = std::chrono::high_resolution_clock::now();

        json result;
        try {
            result = process_query(engine, query);
        } catch (const NotFoundError& e) {
            result = error_response(query, "not_found", e.what());
        } catch (const UnreachableError& e) {
            result = error_response(query, "unreachable", e.what());
        } catch (const EmptyGraphError& e) {
            result = error_response(query, "empty_graph", e.what());
        } catch (const InvalidRequestError& e) {
            result = error_response(query, "invalid_request", e.what());
        } catch (const json::exception& e) {
            result = error_response(query, "invalid_request", e.what());
        } catch (const std::exception& e) {
            std::cerr << "Error processing query: " << e.what() << std::endl;
            result = error_response(query, "internal", e.what());
        }
        if (result.contains("error")) ++failures;

        auto end_time = std::chrono::high_resolution_clock::now();
        result["processing_time"] = std::chrono::duration<double, std::milli>(end_time - start_time).count();
        results_array.push_back(result);
    }

    final_output["results"] = results_array;
    output_file << final_output.dump(4) << std::endl;
    output_file.close();

    std::cout << "Processed " << results_array.size() << " queries ("
              << failures << " failed) -> " << output_path << std::endl;
    return 0;
}
