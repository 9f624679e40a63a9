#include "types.hpp"
#include "util.hpp"
#include <stdexcept>

std::string to_string(Priority priority) {
    switch (priority) {
        case Priority::Low: return "low";
        case Priority::Medium: return "medium";
        case Priority::High: return "high";
        case Priority::Critical: return "critical";
    }
    return "unknown";
}

std::string to_string(AlertStatus status) {
    switch (status) {
        case AlertStatus::Pending: return "pending";
        case AlertStatus::Acknowledged: return "acknowledged";
        case AlertStatus::Resolved: return "resolved";
        case AlertStatus::Escalated: return "escalated";
    }
    return "unknown";
}

Priority parse_priority(const std::string& value) {
    std::string v = util::to_lower(util::trim(value));
    if (v == "low") return Priority::Low;
    if (v == "medium") return Priority::Medium;
    if (v == "high") return Priority::High;
    if (v == "critical") return Priority::Critical;
    throw std::invalid_argument("Unknown priority: " + value);
}

AlertStatus parse_status(const std::string& value) {
    std::string v = util::to_lower(util::trim(value));
    if (v == "pending") return AlertStatus::Pending;
    if (v == "acknowledged") return AlertStatus::Acknowledged;
    if (v == "resolved") return AlertStatus::Resolved;
    if (v == "escalated") return AlertStatus::Escalated;
    throw std::invalid_argument("Unknown status: " + value);
}

nlohmann::json Alert::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"priority", to_string(priority)},
        {"status", to_string(status)},
        {"created_at", util::to_iso8601(created_at)},
        {"created_at_ms", util::to_timestamp_ms(created_at)},
        {"assigned_to", assigned_to},
        {"escalation_level", escalation_level},
        {"alert_type", metadata.alert_type},
        {"department", metadata.department},
        {"room_number", metadata.room_number},
        {"description", metadata.description},
        {"created_by", metadata.created_by}
    };
    
    j["acknowledged_at"] = acknowledged_at ? nlohmann::json(util::to_iso8601(*acknowledged_at))
                                           : nlohmann::json(nullptr);
    j["resolved_at"] = resolved_at ? nlohmann::json(util::to_iso8601(*resolved_at))
                                   : nlohmann::json(nullptr);
    
    nlohmann::json history = nlohmann::json::array();
    for (const auto& rec : escalations) {
        history.push_back({
            {"from_level", rec.from_level},
            {"to_level", rec.to_level},
            {"from_role", rec.from_role},
            {"to_role", rec.to_role},
            {"reason", rec.reason},
            {"actor", rec.actor},
            {"at", util::to_iso8601(rec.at)}
        });
    }
    j["escalations"] = history;
    
    return j;
}

Alert Alert::from_json(const nlohmann::json& j) {
    Alert alert;
    alert.id = j.value("id", "");
    if (alert.id.empty()) {
        alert.id = util::generate_uuid();
    }
    alert.priority = parse_priority(j.value("priority", "medium"));
    alert.status = parse_status(j.value("status", "pending"));
    alert.escalation_level = j.value("escalation_level", 1);
    if (alert.escalation_level < 1) {
        throw std::invalid_argument("Alert " + alert.id + " has escalation_level below 1");
    }
    
    // Millisecond timestamps win over ISO-8601 (which only carries seconds)
    if (j.contains("created_at_ms")) {
        alert.created_at = util::from_timestamp_ms(j["created_at_ms"].get<int64_t>());
    } else if (j.contains("created_at") && j["created_at"].is_string()) {
        alert.created_at = util::from_iso8601(j["created_at"].get<std::string>());
    } else {
        throw std::invalid_argument("Alert " + alert.id + " has no created_at");
    }
    
    if (j.contains("assigned_to") && j["assigned_to"].is_array()) {
        for (const auto& a : j["assigned_to"]) {
            alert.assigned_to.push_back(a.get<std::string>());
        }
    }
    
    alert.metadata.alert_type = j.value("alert_type", "");
    alert.metadata.department = j.value("department", "");
    alert.metadata.room_number = j.value("room_number", "");
    alert.metadata.description = j.value("description", "");
    alert.metadata.created_by = j.value("created_by", "");
    
    return alert;
}
