#include "events.hpp"
#include "util.hpp"

std::string to_string(EventKind kind) {
    switch (kind) {
        case EventKind::Notify: return "notify";
        case EventKind::Overdue: return "overdue";
        case EventKind::StatusChanged: return "status_changed";
        case EventKind::Assignment: return "assignment";
        case EventKind::Audit: return "audit";
    }
    return "unknown";
}

namespace events {

Event notify(const Alert& alert, const NotificationDecision& decision,
             const TimerState& timer, const std::string& text) {
    return Event{EventKind::Notify, alert.id, {
        {"type", "notify"},
        {"alert_id", alert.id},
        {"priority", to_string(alert.priority)},
        {"threshold", decision.threshold},
        {"classification", to_string(decision.classification)},
        {"timer", timer.to_json()},
        {"text", text}
    }};
}

Event overdue(const Alert& alert, const TimerState& timer, const EscalationTiers& tiers,
              const std::string& text) {
    nlohmann::json next_role = nullptr;
    if (tiers.can_escalate(alert.escalation_level)) {
        next_role = tiers.role_for(alert.escalation_level + 1);
    }
    
    return Event{EventKind::Overdue, alert.id, {
        {"type", "overdue"},
        {"alert_id", alert.id},
        {"priority", to_string(alert.priority)},
        {"overdue_seconds", timer.overdue_seconds()},
        {"escalation_level", alert.escalation_level},
        {"role", tiers.role_for(alert.escalation_level)},
        {"escalate_to_role", next_role},
        {"text", text}
    }};
}

Event status_changed(const Alert& before, const Alert& after, AlertAction action,
                     const std::string& actor, TimePoint at, const EscalationTiers& tiers) {
    return Event{EventKind::StatusChanged, after.id, {
        {"type", "status_changed"},
        {"alert_id", after.id},
        {"from", to_string(before.status)},
        {"to", to_string(after.status)},
        {"action", to_string(action)},
        {"actor", actor},
        {"escalation_level", after.escalation_level},
        {"role", tiers.role_for(after.escalation_level)},
        {"ts", util::to_iso8601(at)},
        {"alert", after.to_json()}
    }};
}

Event assignment(const Alert& alert, const std::string& actor, TimePoint at) {
    return Event{EventKind::Assignment, alert.id, {
        {"type", "assignment"},
        {"alert_id", alert.id},
        {"assigned_to", alert.assigned_to},
        {"actor", actor},
        {"ts", util::to_iso8601(at)}
    }};
}

} // namespace events
