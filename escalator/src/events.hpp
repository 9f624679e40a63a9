#pragma once

#include "types.hpp"
#include "dedup.hpp"
#include "escalation_timer.hpp"
#include "lifecycle.hpp"
#include "priority.hpp"
#include <string>
#include <nlohmann/json.hpp>

enum class EventKind {
    Notify,
    Overdue,
    StatusChanged,
    Assignment,
    Audit
};

std::string to_string(EventKind kind);

struct Event {
    EventKind kind;
    std::string alert_id;
    nlohmann::json payload;
};

// Outbound collaborator. publish() must not block on delivery.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void publish(const Event& event) = 0;
};

namespace events {
    Event notify(const Alert& alert, const NotificationDecision& decision,
                 const TimerState& timer, const std::string& text);
    // Carries the role currently responsible and the role to page next
    // (null at the highest tier).
    Event overdue(const Alert& alert, const TimerState& timer, const EscalationTiers& tiers,
                  const std::string& text);
    Event status_changed(const Alert& before, const Alert& after, AlertAction action,
                         const std::string& actor, TimePoint at, const EscalationTiers& tiers);
    Event assignment(const Alert& alert, const std::string& actor, TimePoint at);
}
