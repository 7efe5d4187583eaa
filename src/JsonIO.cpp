#include "JsonIO.hpp"
#include "Errors.hpp"
#include <cmath>
#include <ctime>
#include <fstream>
#include <initializer_list>

static const json* findField(const json& obj, std::initializer_list<const char*> keys){
    if(!obj.is_object()) return nullptr;
    for(const char* key : keys){
        auto it = obj.find(key);
        if(it != obj.end() && !it->is_null()) return &*it;
    }
    return nullptr;
}

// Ids are strings; integer ids from older graph files are accepted as-is.
static bool idFromJson(const json& value, std::string& out){
    if(value.is_string()){
        out = value.get<std::string>();
        return true;
    }
    if(value.is_number_integer()){
        out = std::to_string(value.get<long long>());
        return true;
    }
    return false;
}

static bool lngLatFromArray(const json& value, LngLat& out){
    if(!value.is_array() || value.size() < 2) return false;
    if(!value[0].is_number() || !value[1].is_number()) return false;
    out.lng = value[0].get<double>();
    out.lat = value[1].get<double>();
    return true;
}

// ---------------- graph input ---------------------------

static Node nodeFromJson(const json& n){
    Node node;
    const json* id = findField(n, {"id", "_id"});
    if(!id || !idFromJson(*id, node.id)){
        throw GraphDataError("intersection without a string or integer id");
    }
    node.name = n.value("name", node.id);

    if(const json* location = findField(n, {"location"})){
        const json* coords = location->is_object() ? findField(*location, {"coordinates"}) : location;
        LngLat p;
        if(!coords || !lngLatFromArray(*coords, p)){
            throw GraphDataError("intersection '" + node.id + "' has a malformed location");
        }
        node.lng = p.lng;
        node.lat = p.lat;
    } else {
        const json* lng = findField(n, {"lng", "lon", "longitude"});
        const json* lat = findField(n, {"lat", "latitude"});
        if(!lng || !lat || !lng->is_number() || !lat->is_number()){
            throw GraphDataError("intersection '" + node.id + "' has no numeric lng/lat");
        }
        node.lng = lng->get<double>();
        node.lat = lat->get<double>();
    }

    if(const json* tags = findField(n, {"tags"})){
        for(const auto& tag : *tags) node.tags.push_back(tag.get<std::string>());
    }
    return node;
}

static Edge edgeFromJson(const json& e, const Graph& graph){
    Edge edge;
    const json* id = findField(e, {"id", "_id"});
    if(!id || !idFromJson(*id, edge.id)){
        throw GraphDataError("street without a string or integer id");
    }
    edge.name = e.value("name", edge.id);

    const json* u = findField(e, {"start", "start_intersection_id", "u"});
    const json* v = findField(e, {"end", "end_intersection_id", "v"});
    if(!u || !v || !idFromJson(*u, edge.u) || !idFromJson(*v, edge.v)){
        throw GraphDataError("street '" + edge.id + "' is missing its start or end intersection");
    }

    if(const json* geometry = findField(e, {"geometry"})){
        const json* coords = geometry->is_object() ? findField(*geometry, {"coordinates"}) : geometry;
        if(!coords || !coords->is_array()){
            throw GraphDataError("street '" + edge.id + "' has a malformed geometry");
        }
        for(const auto& c : *coords){
            LngLat p;
            if(!lngLatFromArray(c, p) || !Geo::isValidCoordinate(p.lng, p.lat)){
                throw GraphDataError("street '" + edge.id + "' has an invalid geometry point");
            }
            edge.geometry.push_back(p);
        }
    }

    if(const json* distance = findField(e, {"distance_m", "length"})){
        if(!distance->is_number()){
            throw GraphDataError("street '" + edge.id + "' has a non-numeric distance_m");
        }
        edge.distance_m = distance->get<double>();
    } else if(edge.geometry.size() >= 2){
        edge.distance_m = Geo::polylineLength(edge.geometry);
    } else {
        const Node* a = graph.getNode(edge.u);
        const Node* b = graph.getNode(edge.v);
        if(a && b) edge.distance_m = Geo::haversineDistance(a->position(), b->position());
    }

    edge.danger_score = e.value("danger_score", 0.0);
    if(const json* accessible = findField(e, {"accessible", "is_accessible"})){
        edge.accessible = accessible->get<bool>();
    }
    if(const json* bidirectional = findField(e, {"bidirectional"})){
        edge.bidirectional = bidirectional->get<bool>();
    } else {
        edge.bidirectional = !e.value("oneway", false);
    }
    return edge;
}

Graph graphFromJson(const json& graph_json){
    if(!graph_json.is_object()){
        throw GraphDataError("graph root must be a JSON object");
    }
    Graph graph;
    try {
        if(graph_json.contains("nodes")){
            for(const auto& n : graph_json["nodes"]) graph.addNode(nodeFromJson(n));
        }
        if(graph_json.contains("edges")){
            for(const auto& e : graph_json["edges"]) graph.addEdge(edgeFromJson(e, graph));
        }
    } catch (const json::exception& ex) {
        throw GraphDataError(std::string("malformed graph: ") + ex.what());
    }
    return graph;
}

Graph loadGraphFile(const std::string& path){
    std::ifstream graph_file(path);
    if(!graph_file.is_open()){
        throw GraphDataError("failed to open graph file: " + path);
    }
    json graph_json;
    try {
        graph_file >> graph_json;
    } catch (const json::exception& ex) {
        throw GraphDataError("failed to parse " + path + ": " + ex.what());
    }
    return graphFromJson(graph_json);
}

// ---------------- request payloads ---------------------------

std::string requireString(const json& obj, const char* key){
    const json* value = findField(obj, {key});
    std::string out;
    if(!value || !idFromJson(*value, out)){
        throw InvalidRequestError(std::string("field '") + key + "' must be a string");
    }
    return out;
}

double requireNumber(const json& obj, const char* key){
    const json* value = findField(obj, {key});
    if(!value || !value->is_number()){
        throw InvalidRequestError(std::string("field '") + key + "' must be a number");
    }
    double d = value->get<double>();
    if(!std::isfinite(d)){
        throw InvalidRequestError(std::string("field '") + key + "' must be finite");
    }
    return d;
}

static std::string requireId(const json& obj, std::initializer_list<const char*> keys, const char* what){
    const json* value = findField(obj, keys);
    std::string out;
    if(!value || !idFromJson(*value, out)){
        throw InvalidRequestError(std::string("missing or malformed ") + what);
    }
    return out;
}

static bool optionalBool(const json& obj, const char* key, bool fallback){
    const json* value = findField(obj, {key});
    if(!value) return fallback;
    if(!value->is_boolean()){
        throw InvalidRequestError(std::string("field '") + key + "' must be a boolean");
    }
    return value->get<bool>();
}

static std::optional<std::string> optionalString(const json& obj, std::initializer_list<const char*> keys){
    const json* value = findField(obj, keys);
    if(!value) return std::nullopt;
    std::string out;
    if(!idFromJson(*value, out)){
        throw InvalidRequestError(std::string("field '") + *keys.begin() + "' must be a string or null");
    }
    return out;
}

RouteQuery routeQueryFromJson(const json& query){
    RouteQuery route;
    route.start = requireId(query, {"start", "origin", "source"}, "start intersection");
    route.end = requireId(query, {"end", "destination", "target"}, "end intersection");

    const json* mode = findField(query, {"mode"});
    if(mode){
        if(!mode->is_string()) throw InvalidRequestError("field 'mode' must be a string");
        route.mode = parseRouteMode(mode->get<std::string>());
    }
    route.ada_required = optionalBool(query, "ada_required", false);
    return route;
}

LngLat pointFromJson(const json& point){
    LngLat p;
    bool ok = false;
    if(point.is_array()){
        ok = lngLatFromArray(point, p);
    } else if(point.is_object()){
        const json* lng = findField(point, {"lng", "lon", "longitude"});
        const json* lat = findField(point, {"lat", "latitude"});
        if(lng && lat && lng->is_number() && lat->is_number()){
            p.lng = lng->get<double>();
            p.lat = lat->get<double>();
            ok = true;
        }
    }
    if(!ok){
        throw InvalidRequestError("a point needs numeric lng and lat");
    }
    if(!Geo::isValidCoordinate(p.lng, p.lat)){
        throw InvalidRequestError("point lies outside valid longitude/latitude ranges");
    }
    return p;
}

IncidentReport incidentReportFromJson(const json& query){
    IncidentReport report;
    report.raw_text = requireString(query, "raw_text");
    if(report.raw_text.empty()){
        throw InvalidRequestError("field 'raw_text' must not be empty");
    }
    report.severity = requireNumber(query, "severity");
    report.street_id = optionalString(query, {"street_id", "resolved_street_id"});
    report.street_name = optionalString(query, {"street", "parsed_street"});
    report.category = optionalString(query, {"category"});

    if(const json* location = findField(query, {"location"})){
        const json* coords = (location->is_object() && location->contains("coordinates"))
                                 ? &(*location)["coordinates"] : location;
        report.location = pointFromJson(*coords);
    } else if(findField(query, {"longitude"}) && findField(query, {"latitude"})){
        report.location = pointFromJson(query);
    }
    return report;
}

// ---------------- output ---------------------------

std::string formatTimestamp(std::chrono::system_clock::time_point tp){
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

json toJson(const LngLat& point){
    return json::array({point.lng, point.lat});
}

json toJson(const Node& node){
    json n;
    n["id"] = node.id;
    n["name"] = node.name;
    n["location"] = {{"type", "Point"}, {"coordinates", toJson(node.position())}};
    n["tags"] = node.tags;
    return n;
}

json toJson(const Edge& edge){
    json coords = json::array();
    for(const LngLat& p : edge.geometry) coords.push_back(toJson(p));

    json e;
    e["id"] = edge.id;
    e["name"] = edge.name;
    e["start_intersection_id"] = edge.u;
    e["end_intersection_id"] = edge.v;
    e["geometry"] = {{"type", "LineString"}, {"coordinates", coords}};
    e["distance_m"] = edge.distance_m;
    e["danger_score"] = edge.danger_score;
    e["is_accessible"] = edge.accessible;
    e["bidirectional"] = edge.bidirectional;
    return e;
}

json toJson(const RouteResult& route){
    json coords = json::array();
    for(const LngLat& p : route.coordinates) coords.push_back(toJson(p));

    json r;
    r["path"] = route.path;
    r["streets"] = route.streets;
    r["coordinates"] = coords;
    r["total_cost"] = route.total_cost;
    r["total_distance_m"] = route.total_distance_m;
    r["total_danger"] = route.total_danger;
    r["mode"] = routeModeName(route.mode);
    r["ada_required"] = route.ada_required;
    r["hazards_bypassed"] = route.hazards_bypassed;
    return r;
}

json toJson(const Incident& incident){
    json i;
    i["id"] = incident.id;
    i["raw_text"] = incident.raw_text;
    i["street_id"] = incident.street_id ? json(*incident.street_id) : json(nullptr);
    i["parsed_street"] = incident.street_name ? json(*incident.street_name) : json(nullptr);
    i["severity"] = incident.severity;
    i["category"] = incident.category ? json(*incident.category) : json(nullptr);
    if(incident.location){
        i["location"] = {{"type", "Point"}, {"coordinates", toJson(*incident.location)}};
    } else {
        i["location"] = nullptr;
    }
    i["reported_at"] = formatTimestamp(incident.reported_at);
    i["resolved"] = incident.resolved;
    return i;
}
