#include "priority.hpp"
#include <fmt/format.h>

int priority_weight(Priority priority) {
    switch (priority) {
        case Priority::Critical: return 1;
        case Priority::High: return 2;
        case Priority::Medium: return 3;
        case Priority::Low: return 4;
    }
    return 5;
}

int status_weight(AlertStatus status) {
    switch (status) {
        case AlertStatus::Escalated: return 1;
        case AlertStatus::Pending: return 2;
        case AlertStatus::Acknowledged: return 3;
        case AlertStatus::Resolved: return 4;
    }
    return 5;
}

int EscalationThresholds::minutes_for(Priority priority) const {
    switch (priority) {
        case Priority::Critical: return critical_minutes;
        case Priority::High: return high_minutes;
        case Priority::Medium: return medium_minutes;
        case Priority::Low: return low_minutes;
    }
    return low_minutes;
}

void EscalationThresholds::validate() const {
    if (critical_minutes <= 0 || high_minutes <= 0 ||
        medium_minutes <= 0 || low_minutes <= 0) {
        throw ConfigError("Escalation thresholds must be positive");
    }
    
    if (!(critical_minutes < high_minutes &&
          high_minutes < medium_minutes &&
          medium_minutes < low_minutes)) {
        throw ConfigError(fmt::format(
            "Escalation thresholds must satisfy critical < high < medium < low "
            "(got {}/{}/{}/{})",
            critical_minutes, high_minutes, medium_minutes, low_minutes));
    }
}

std::string EscalationTiers::role_for(int level) const {
    if (level < 1 || level > max_tier()) return "";
    return roles[static_cast<size_t>(level - 1)];
}

void EscalationTiers::validate() const {
    if (roles.empty()) {
        throw ConfigError("At least one escalation tier is required");
    }
    for (size_t i = 0; i < roles.size(); i++) {
        if (roles[i].empty()) {
            throw ConfigError(fmt::format("Escalation tier {} has no role", i + 1));
        }
    }
}
