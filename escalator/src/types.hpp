#pragma once

#include "clock.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

enum class Priority {
    Low,
    Medium,
    High,
    Critical
};

enum class AlertStatus {
    Pending,
    Acknowledged,
    Resolved,
    Escalated
};

std::string to_string(Priority priority);
std::string to_string(AlertStatus status);
Priority parse_priority(const std::string& value);
AlertStatus parse_status(const std::string& value);

struct AlertMetadata {
    std::string alert_type;
    std::string department;
    std::string room_number;
    std::string description;
    std::string created_by;
};

struct EscalationRecord {
    int from_level;
    int to_level;
    std::string from_role;
    std::string to_role;
    std::string reason;  // "timeout" or "manual"
    std::string actor;
    TimePoint at;
};

struct Alert {
    std::string id;
    Priority priority = Priority::Medium;
    AlertStatus status = AlertStatus::Pending;
    TimePoint created_at;
    std::optional<TimePoint> acknowledged_at;
    std::optional<TimePoint> resolved_at;
    std::vector<std::string> assigned_to;
    
    int escalation_level = 1;
    std::vector<EscalationRecord> escalations;
    AlertMetadata metadata;
    
    bool is_open() const {
        return status == AlertStatus::Pending || status == AlertStatus::Escalated;
    }
    
    nlohmann::json to_json() const;
    static Alert from_json(const nlohmann::json& j);
};
