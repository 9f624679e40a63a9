#include "audit.hpp"
#include "util.hpp"

Event Auditor::build_audit_event(const Alert& before, const Alert& after,
                                 AlertAction action, const std::string& actor,
                                 TimePoint at) {
    return Event{EventKind::Audit, after.id, {
        {"kind", "alert_" + to_string(action)},
        {"alert_id", after.id},
        {"action", to_string(action)},
        {"from", to_string(before.status)},
        {"to", to_string(after.status)},
        {"actor", actor.empty() ? "system" : actor},
        {"system_action", actor.empty() || actor == "system"},
        {"ts", util::to_iso8601(at)}
    }};
}
