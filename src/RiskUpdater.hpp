#ifndef RISK_UPDATER_HPP
#define RISK_UPDATER_HPP

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Geometry.hpp"

class GraphStore;

enum class DangerPolicy {
    Max,     // keep the higher of the current score and the severity
    Replace, // latest report wins
    Blend    // exponential moving average towards the severity
};

const char* dangerPolicyName(DangerPolicy policy);
double combineDanger(DangerPolicy policy, double old_score, double severity, double blend_weight);

// A report after the text classifier has run: street, severity and category
// are already extracted.
struct IncidentReport {
    std::string raw_text;
    std::optional<std::string> street_id;
    std::optional<std::string> street_name;
    double severity = 0.0;
    std::optional<std::string> category;
    std::optional<LngLat> location;
};

struct Incident {
    std::string id;
    std::chrono::system_clock::time_point reported_at;
    std::string raw_text;
    std::optional<std::string> street_id;
    std::optional<std::string> street_name;
    double severity = 0.0;
    std::optional<std::string> category;
    std::optional<LngLat> location;
    bool resolved = false;
};

// Append-only incident history. Only the resolved flag changes after record().
class IncidentLog {
private:
    mutable std::mutex mutex;
    std::vector<Incident> incidents;
    std::unordered_map<std::string, size_t> id_to_index;
    std::uint64_t next_id = 1;

public:
    Incident record(const IncidentReport& report);

    Incident get(const std::string& incident_id) const;
    void markResolved(const std::string& incident_id);
    std::vector<Incident> recent(size_t limit) const; // newest first
    size_t size() const;
};

class RiskUpdater {
private:
    GraphStore& store;
    IncidentLog& log;
    DangerPolicy policy;
    double blend_weight;
    bool verbose;

    bool applyToStreet(const std::string& street_id, double severity);

public:
    RiskUpdater(GraphStore& graph_store, IncidentLog& incident_log,
                DangerPolicy danger_policy = DangerPolicy::Max,
                double blend = 0.4, bool verbose_log = false);

    // Records the incident, then updates the named street's score under the
    // configured policy. Returns the street id, or nullopt when no street
    // was named or the id is unknown (logged, not thrown). The stored
    // record is copied to *recorded when given.
    std::optional<std::string> applyIncident(const IncidentReport& report, Incident* recorded = nullptr);

    // Applies one report to every street whose name contains street_name.
    std::vector<std::string> applyIncidentByStreetName(const IncidentReport& report,
                                                       const std::string& street_name,
                                                       Incident* recorded = nullptr);

    DangerPolicy getPolicy() const { return policy; }
};
#endif
