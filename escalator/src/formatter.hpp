#pragma once
#include "types.hpp"
#include "dedup.hpp"
#include "escalation_timer.hpp"
#include <string>

// Human-readable text for notification and paging collaborators.
class AlertFormatter {
public:
    static std::string format_notification(const Alert& alert,
                                           const NotificationDecision& decision,
                                           const TimerState& timer);
    static std::string format_overdue(const Alert& alert, const TimerState& timer);
    static std::string format_duration(int64_t seconds);
    
private:
    static std::string build_title(const std::string& tag, const Alert& alert);
    static std::string location(const AlertMetadata& metadata);
};
