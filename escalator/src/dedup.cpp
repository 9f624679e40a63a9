#include "dedup.hpp"
#include <utility>

std::string to_string(NotificationClass cls) {
    switch (cls) {
        case NotificationClass::Info: return "info";
        case NotificationClass::Warning: return "warning";
        case NotificationClass::Critical: return "critical";
    }
    return "unknown";
}

NotificationDeduper::NotificationDeduper(NotificationSettings settings)
    : settings_(std::move(settings)) {}

NotificationClass NotificationDeduper::classify(int threshold) {
    if (threshold <= 25) return NotificationClass::Critical;
    if (threshold <= 50) return NotificationClass::Warning;
    return NotificationClass::Info;
}

std::optional<NotificationDecision>
NotificationDeduper::should_notify(double percentage_remaining,
                                   const NotificationRecord& record) const {
    if (!settings_.enabled) return std::nullopt;
    
    for (int threshold : settings_.thresholds) {
        if (percentage_remaining <= threshold && !record.has_fired(threshold)) {
            return NotificationDecision{threshold, classify(threshold)};
        }
    }
    
    return std::nullopt;
}
