#pragma once

#include <set>
#include <string>
#include <vector>
#include <optional>

enum class NotificationClass {
    Info,
    Warning,
    Critical
};

std::string to_string(NotificationClass cls);

struct NotificationSettings {
    bool enabled = true;
    std::vector<int> thresholds{50, 25, 10};  // percentage-remaining checkpoints
};

// Thresholds already fired for one alert. Only grows while the alert is open.
struct NotificationRecord {
    std::set<int> fired;
    
    bool has_fired(int threshold) const { return fired.count(threshold) > 0; }
    void record(int threshold) { fired.insert(threshold); }
};

struct NotificationDecision {
    int threshold;
    NotificationClass classification;
};

class NotificationDeduper {
public:
    explicit NotificationDeduper(NotificationSettings settings);
    
    // Does not touch the record; the caller records the returned threshold.
    std::optional<NotificationDecision> should_notify(double percentage_remaining,
                                                      const NotificationRecord& record) const;
    
    static NotificationClass classify(int threshold);
    const NotificationSettings& settings() const { return settings_; }
    
private:
    NotificationSettings settings_;
};
