#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <string>

#include "RiskUpdater.hpp"
#include "SpatialIndex.hpp"

namespace Config {
    constexpr double BLEND_WEIGHT = 0.4;            // share of a new severity under the blend policy
    constexpr size_t INCIDENT_LIST_LIMIT = 50;      // newest-first incident listing
    constexpr size_t DANGEROUS_STREETS_LIMIT = 10;
}

struct EngineConfig {
    DangerPolicy danger_policy = DangerPolicy::Max;
    double blend_weight = Config::BLEND_WEIGHT;
    SpatialIndexKind spatial_index = SpatialIndexKind::KdTree;
    size_t incident_list_limit = Config::INCIDENT_LIST_LIMIT;
    size_t dangerous_streets_limit = Config::DANGEROUS_STREETS_LIMIT;
    bool verbose = false;
};

DangerPolicy parseDangerPolicy(const std::string& name);
SpatialIndexKind parseSpatialIndexKind(const std::string& name);

// Reads a JSON object of overrides; missing keys keep their defaults.
// Throws ConfigError on unknown values or an unreadable file.
EngineConfig loadEngineConfig(const std::string& path);
#endif
