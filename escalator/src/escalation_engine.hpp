#pragma once

#include "types.hpp"
#include "clock.hpp"
#include "priority.hpp"
#include "escalation_timer.hpp"
#include "dedup.hpp"
#include "lifecycle.hpp"
#include "alert_queue.hpp"
#include "alert_filter.hpp"
#include "events.hpp"
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

struct EngineSettings {
    EscalationThresholds thresholds;
    EscalationTiers tiers;
    NotificationSettings notifications;
    size_t max_visible = 3;
    bool auto_escalate_on_overdue = true;
    bool archive_resolved = true;
};

// Snapshot of one alert taken under the engine lock. notifications is set
// exactly when the alert is open.
struct AlertView {
    Alert alert;
    TimerState timer;
    bool awaiting_overdue_ack;
    std::optional<NotificationRecord> notifications;
    
    nlohmann::json to_json() const;
};

struct ActionRequest {
    std::string alert_id;
    AlertAction action;
    std::string actor;
    bool confirmed = false;
    std::vector<std::string> assignees;
    
    static ActionRequest from_json(const nlohmann::json& j);
};

struct TickReport {
    size_t evaluated = 0;
    size_t notifications = 0;
    size_t overdue = 0;
    size_t escalated = 0;
};

class EscalationEngine {
public:
    EscalationEngine(EngineSettings settings,
                     std::shared_ptr<Clock> clock,
                     std::shared_ptr<EventSink> sink);
    
    Alert create_alert(Priority priority, const AlertMetadata& metadata);
    void add_alert(const Alert& alert);
    bool remove(const std::string& alert_id);
    
    // Throws LifecycleError: UnknownAlert for an id not in the working set,
    // InvalidTransition (with the valid actions) for an illegal action.
    Alert apply_action(const ActionRequest& request);
    std::vector<ActionDescriptor> available_actions(const std::string& alert_id) const;
    
    TickReport tick(TimePoint now);
    TickReport tick();
    
    std::vector<AlertView> get_visible(size_t max_visible, TimePoint now) const;
    std::vector<AlertView> get_queued(size_t max_visible, TimePoint now) const;
    std::optional<AlertView> get_alert(const std::string& alert_id, TimePoint now) const;
    std::vector<AlertView> overdue_worklist(TimePoint now) const;
    std::vector<AlertView> query(const AlertFilter& filter, TimePoint now) const;
    
    std::optional<NotificationRecord> notification_record(const std::string& alert_id) const;
    size_t size() const;
    const EngineSettings& settings() const { return settings_; }
    TimePoint now() const { return clock_->now(); }
    
private:
    struct Tracking {
        NotificationRecord notifications;
        bool overdue_reported = false;
        bool awaiting_overdue_ack = false;
        bool overdue_acknowledged = false;
    };
    
    EngineSettings settings_;
    NotificationDeduper deduper_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<EventSink> sink_;
    
    // Guards queue_ and tracking_ together
    mutable std::shared_mutex mutex_;
    AlertQueue queue_;
    std::map<std::string, Tracking> tracking_;
    
    TimerState timer_for(const Alert& alert, TimePoint now) const;
    AlertView make_view(const Alert& alert, TimePoint now) const;
    std::vector<AlertView> make_views(const std::vector<Alert>& alerts, TimePoint now) const;
    void store_transition(const Alert& updated);
    void emit(const std::vector<Event>& events);
};
