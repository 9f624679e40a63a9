#include "formatter.hpp"
#include "util.hpp"
#include <fmt/format.h>

std::string AlertFormatter::location(const AlertMetadata& metadata) {
    if (!metadata.department.empty() && !metadata.room_number.empty()) {
        return fmt::format(" ({} room {})", metadata.department, metadata.room_number);
    }
    if (!metadata.department.empty()) {
        return fmt::format(" ({})", metadata.department);
    }
    if (!metadata.room_number.empty()) {
        return fmt::format(" (room {})", metadata.room_number);
    }
    return "";
}

std::string AlertFormatter::build_title(const std::string& tag, const Alert& alert) {
    return fmt::format("[{}] {} alert {}{}", tag, to_string(alert.priority),
                       alert.id, location(alert.metadata));
}

std::string AlertFormatter::format_notification(const Alert& alert,
                                                const NotificationDecision& decision,
                                                const TimerState& timer) {
    std::string tag = util::to_upper(to_string(decision.classification));
    if (timer.is_overdue()) {
        return build_title(tag, alert) + ": escalation deadline passed";
    }
    return fmt::format("{}: {} remaining", build_title(tag, alert), timer.display);
}

std::string AlertFormatter::format_overdue(const Alert& alert, const TimerState& timer) {
    return fmt::format("{}: overdue by {}, escalation required",
                       build_title("OVERDUE", alert),
                       format_duration(timer.overdue_seconds()));
}

std::string AlertFormatter::format_duration(int64_t seconds) {
    if (seconds >= 3600) {
        return fmt::format("{}h {}m", seconds / 3600, (seconds % 3600) / 60);
    }
    if (seconds >= 60) {
        return fmt::format("{}m {}s", seconds / 60, seconds % 60);
    }
    return fmt::format("{}s", seconds);
}
