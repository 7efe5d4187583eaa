#include "Config.hpp"
#include "Errors.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

DangerPolicy parseDangerPolicy(const std::string& name){
    if(name == "max") return DangerPolicy::Max;
    if(name == "replace") return DangerPolicy::Replace;
    if(name == "blend") return DangerPolicy::Blend;
    throw ConfigError("unknown danger_policy '" + name + "' (expected max, replace or blend)");
}

SpatialIndexKind parseSpatialIndexKind(const std::string& name){
    if(name == "linear") return SpatialIndexKind::Linear;
    if(name == "kdtree") return SpatialIndexKind::KdTree;
    throw ConfigError("unknown spatial_index '" + name + "' (expected linear or kdtree)");
}

EngineConfig loadEngineConfig(const std::string& path){
    std::ifstream config_file(path);
    if(!config_file.is_open()){
        throw ConfigError("failed to open config file: " + path);
    }

    EngineConfig config;
    try {
        json c;
        config_file >> c;
        if(!c.is_object()){
            throw ConfigError("config root must be a JSON object");
        }
        if(c.contains("danger_policy")) config.danger_policy = parseDangerPolicy(c["danger_policy"].get<std::string>());
        if(c.contains("spatial_index")) config.spatial_index = parseSpatialIndexKind(c["spatial_index"].get<std::string>());
        config.blend_weight = c.value("blend_weight", config.blend_weight);
        config.incident_list_limit = c.value("incident_list_limit", config.incident_list_limit);
        config.dangerous_streets_limit = c.value("dangerous_streets_limit", config.dangerous_streets_limit);
        config.verbose = c.value("verbose", config.verbose);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("malformed config ") + path + ": " + e.what());
    }

    if(!(config.blend_weight >= 0.0 && config.blend_weight <= 1.0)){
        throw ConfigError("blend_weight must be within [0, 1]");
    }
    return config;
}
