#include "RiskUpdater.hpp"
#include "GraphStore.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cstdio>
#include <iostream>

const char* dangerPolicyName(DangerPolicy policy){
    switch(policy){
        case DangerPolicy::Max: return "max";
        case DangerPolicy::Replace: return "replace";
        case DangerPolicy::Blend: return "blend";
    }
    return "max";
}

double combineDanger(DangerPolicy policy, double old_score, double severity, double blend_weight){
    severity = clampDanger(severity);
    switch(policy){
        case DangerPolicy::Replace:
            return severity;
        case DangerPolicy::Blend:
            return clampDanger((1.0 - blend_weight) * old_score + blend_weight * severity);
        case DangerPolicy::Max:
        default:
            return clampDanger(std::max(old_score, severity));
    }
}

Incident IncidentLog::record(const IncidentReport& report){
    std::lock_guard<std::mutex> lock(mutex);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "inc-%06llu", static_cast<unsigned long long>(next_id++));

    Incident incident;
    incident.id = buf;
    incident.reported_at = std::chrono::system_clock::now();
    incident.raw_text = report.raw_text;
    incident.street_id = report.street_id;
    incident.street_name = report.street_name;
    incident.severity = clampDanger(report.severity);
    incident.category = report.category;
    incident.location = report.location;
    incident.resolved = false;

    id_to_index[incident.id] = incidents.size();
    incidents.push_back(incident);
    return incident;
}

Incident IncidentLog::get(const std::string& incident_id) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = id_to_index.find(incident_id);
    if(it == id_to_index.end()){
        throw NotFoundError("incident '" + incident_id + "' not found");
    }
    return incidents[it->second];
}

void IncidentLog::markResolved(const std::string& incident_id){
    std::lock_guard<std::mutex> lock(mutex);
    auto it = id_to_index.find(incident_id);
    if(it == id_to_index.end()){
        throw NotFoundError("incident '" + incident_id + "' not found");
    }
    incidents[it->second].resolved = true;
}

std::vector<Incident> IncidentLog::recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex);
    size_t n = std::min(limit, incidents.size());
    return std::vector<Incident>(incidents.rbegin(), incidents.rbegin() + n);
}

size_t IncidentLog::size() const {
    std::lock_guard<std::mutex> lock(mutex);
    return incidents.size();
}

RiskUpdater::RiskUpdater(GraphStore& graph_store, IncidentLog& incident_log,
                         DangerPolicy danger_policy, double blend, bool verbose_log)
    : store(graph_store), log(incident_log), policy(danger_policy),
      blend_weight(blend), verbose(verbose_log) {}

bool RiskUpdater::applyToStreet(const std::string& street_id, double severity){
    double before = 0.0;
    double after = 0.0;
    try {
        after = store.updateDangerScore(street_id, [&](double old_score){
            before = old_score;
            return combineDanger(policy, old_score, severity, blend_weight);
        });
    } catch (const NotFoundError& e) {
        // A misresolved incident must not break routing; the report stays in the log.
        std::cerr << "Dropping danger update: " << e.what() << std::endl;
        return false;
    }
    if(verbose){
        std::cout << "Updated street " << street_id << " danger_score: "
                  << before << " -> " << after << " (" << dangerPolicyName(policy) << ")" << std::endl;
    }
    return true;
}

std::optional<std::string> RiskUpdater::applyIncident(const IncidentReport& report, Incident* recorded){
    Incident incident = log.record(report);
    if(recorded) *recorded = incident;
    if(!incident.street_id){
        return std::nullopt;
    }
    if(!applyToStreet(*incident.street_id, incident.severity)){
        return std::nullopt;
    }
    return incident.street_id;
}

std::vector<std::string> RiskUpdater::applyIncidentByStreetName(const IncidentReport& report,
                                                                const std::string& street_name,
                                                                Incident* recorded){
    std::vector<std::string> matches = store.findStreetsByName(street_name);

    IncidentReport resolved = report;
    resolved.street_name = street_name;
    if(!matches.empty()) resolved.street_id = matches.front();
    Incident incident = log.record(resolved);
    if(recorded) *recorded = incident;

    std::vector<std::string> applied;
    for(const std::string& id : matches){
        if(applyToStreet(id, incident.severity)) applied.push_back(id);
    }
    if(matches.empty()){
        std::cerr << "No street matches '" << street_name << "'; incident "
                  << incident.id << " recorded without a graph update" << std::endl;
    }
    return applied;
}
