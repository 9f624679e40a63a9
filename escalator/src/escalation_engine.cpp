#include "escalation_engine.hpp"
#include "audit.hpp"
#include "formatter.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <mutex>

nlohmann::json AlertView::to_json() const {
    nlohmann::json j = alert.to_json();
    j["timer"] = timer.to_json();
    j["awaiting_overdue_ack"] = awaiting_overdue_ack;
    
    nlohmann::json fired = nlohmann::json::array();
    if (notifications) {
        for (int threshold : notifications->fired) fired.push_back(threshold);
    }
    j["notifications_fired"] = fired;
    return j;
}

ActionRequest ActionRequest::from_json(const nlohmann::json& j) {
    ActionRequest req;
    req.alert_id = j.at("alert_id").get<std::string>();
    req.action = parse_action(j.at("action").get<std::string>());
    req.actor = j.value("actor", "");
    req.confirmed = j.value("confirmed", false);
    if (j.contains("assignees") && j["assignees"].is_array()) {
        for (const auto& a : j["assignees"]) {
            req.assignees.push_back(a.get<std::string>());
        }
    }
    return req;
}

EscalationEngine::EscalationEngine(EngineSettings settings,
                                   std::shared_ptr<Clock> clock,
                                   std::shared_ptr<EventSink> sink)
    : settings_(std::move(settings))
    , deduper_(settings_.notifications)
    , clock_(std::move(clock))
    , sink_(std::move(sink))
{
    settings_.thresholds.validate();
    settings_.tiers.validate();
}

TimerState EscalationEngine::timer_for(const Alert& alert, TimePoint now) const {
    return EscalationTimer::compute(alert, settings_.thresholds.minutes_for(alert.priority), now);
}

AlertView EscalationEngine::make_view(const Alert& alert, TimePoint now) const {
    auto it = tracking_.find(alert.id);
    if (it == tracking_.end()) {
        return AlertView{alert, timer_for(alert, now), false, std::nullopt};
    }
    return AlertView{alert, timer_for(alert, now), it->second.awaiting_overdue_ack,
                     it->second.notifications};
}

std::vector<AlertView> EscalationEngine::make_views(const std::vector<Alert>& alerts,
                                                    TimePoint now) const {
    std::vector<AlertView> views;
    views.reserve(alerts.size());
    for (const auto& alert : alerts) {
        views.push_back(make_view(alert, now));
    }
    return views;
}

void EscalationEngine::emit(const std::vector<Event>& events) {
    if (!sink_) return;
    for (const auto& event : events) {
        try {
            sink_->publish(event);
        } catch (const std::exception& e) {
            spdlog::error("Failed to emit {} event for alert {}: {}",
                          to_string(event.kind), event.alert_id, e.what());
        }
    }
}

Alert EscalationEngine::create_alert(Priority priority, const AlertMetadata& metadata) {
    Alert alert;
    alert.id = util::generate_uuid();
    alert.priority = priority;
    alert.status = AlertStatus::Pending;
    alert.created_at = clock_->now();
    alert.metadata = metadata;
    
    add_alert(alert);
    return alert;
}

void EscalationEngine::add_alert(const Alert& alert) {
    if (alert.id.empty()) {
        throw std::invalid_argument("Alert id must not be empty");
    }
    
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        queue_.add(alert);
        if (alert.is_open()) {
            tracking_.emplace(alert.id, Tracking{});
        } else {
            tracking_.erase(alert.id);
        }
    }
    
    spdlog::info("Alert {} queued: priority={}, status={}",
                 alert.id, to_string(alert.priority), to_string(alert.status));
}

bool EscalationEngine::remove(const std::string& alert_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    tracking_.erase(alert_id);
    bool removed = queue_.remove(alert_id);
    if (removed) {
        spdlog::debug("Alert {} removed from working set", alert_id);
    }
    return removed;
}

void EscalationEngine::store_transition(const Alert& updated) {
    if (!updated.is_open()) {
        tracking_.erase(updated.id);
    }
    
    if (updated.status == AlertStatus::Resolved && settings_.archive_resolved) {
        queue_.remove(updated.id);
    } else {
        queue_.update(updated);
    }
}

Alert EscalationEngine::apply_action(const ActionRequest& request) {
    std::vector<Event> pending_events;
    Alert updated;
    
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        
        auto current = queue_.get(request.alert_id);
        if (!current) {
            spdlog::warn("Action {} for unknown alert {}",
                         to_string(request.action), request.alert_id);
            throw LifecycleError::unknown_alert(request.alert_id);
        }
        
        TimePoint now = clock_->now();
        TimerState timer = timer_for(*current, now);
        
        ActionContext ctx;
        ctx.now = now;
        ctx.overdue = timer.is_overdue();
        ctx.confirmed = request.confirmed;
        ctx.actor = request.actor;
        ctx.reason = "manual";
        ctx.assignees = request.assignees;
        ctx.tiers = settings_.tiers;
        
        try {
            updated = AlertLifecycle::apply(*current, request.action, ctx);
        } catch (const LifecycleError& e) {
            spdlog::warn("Rejected action: {}", e.what());
            throw;
        }
        
        if (request.action == AlertAction::AcknowledgeOverdue) {
            auto it = tracking_.find(updated.id);
            if (it != tracking_.end()) {
                it->second.awaiting_overdue_ack = false;
                it->second.overdue_acknowledged = true;
            }
        } else {
            store_transition(updated);
            
            if (current->status != updated.status) {
                pending_events.push_back(events::status_changed(*current, updated, request.action,
                                                                request.actor, now,
                                                                settings_.tiers));
            }
            if (request.action == AlertAction::Reassign) {
                pending_events.push_back(events::assignment(updated, request.actor, now));
            }
        }
        
        pending_events.push_back(Auditor::build_audit_event(*current, updated, request.action,
                                                            request.actor, now));
        
        spdlog::info("Alert {} {}: {} -> {} by {}",
                     updated.id, to_string(request.action),
                     to_string(current->status), to_string(updated.status),
                     request.actor.empty() ? "unknown" : request.actor);
    }
    
    emit(pending_events);
    return updated;
}

std::vector<ActionDescriptor> EscalationEngine::available_actions(const std::string& alert_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto alert = queue_.get(alert_id);
    if (!alert) {
        throw LifecycleError::unknown_alert(alert_id);
    }
    return AlertLifecycle::available_actions(*alert, timer_for(*alert, clock_->now()).is_overdue(),
                                             settings_.tiers);
}

TickReport EscalationEngine::tick() {
    return tick(clock_->now());
}

TickReport EscalationEngine::tick(TimePoint now) {
    TickReport report;
    std::vector<Event> pending_events;
    
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        
        for (const auto& alert : queue_.all()) {
            if (!alert.is_open()) continue;
            
            report.evaluated++;
            TimerState timer = timer_for(alert, now);
            Tracking& tracking = tracking_[alert.id];
            
            // 1. Overdue, reported once per alert. An operator who already
            //    acknowledged it keeps it off the worklist.
            if (timer.is_overdue() && !tracking.overdue_reported) {
                tracking.overdue_reported = true;
                tracking.awaiting_overdue_ack = !tracking.overdue_acknowledged;
                pending_events.push_back(events::overdue(alert, timer, settings_.tiers,
                                                         AlertFormatter::format_overdue(alert, timer)));
                report.overdue++;
                spdlog::warn("Alert {} ({}) is overdue by {}s",
                             alert.id, to_string(alert.priority), timer.overdue_seconds());
            }
            
            // 2. Every checkpoint already reached fires in this tick, so a
            //    repeated tick at the same instant has nothing left to fire
            while (auto decision = deduper_.should_notify(timer.percentage_remaining,
                                                          tracking.notifications)) {
                tracking.notifications.record(decision->threshold);
                pending_events.push_back(events::notify(
                    alert, *decision, timer,
                    AlertFormatter::format_notification(alert, *decision, timer)));
                report.notifications++;
                spdlog::info("Alert {} crossed {}% checkpoint ({})",
                             alert.id, decision->threshold, to_string(decision->classification));
            }
            
            // 3. Auto-escalation of overdue pending alerts
            //    below the highest tier
            if (settings_.auto_escalate_on_overdue &&
                alert.status == AlertStatus::Pending &&
                timer.is_overdue() &&
                settings_.tiers.can_escalate(alert.escalation_level)) {
                ActionContext ctx;
                ctx.now = now;
                ctx.overdue = true;
                ctx.actor = "system";
                ctx.reason = "timeout";
                ctx.tiers = settings_.tiers;
                
                try {
                    Alert escalated = AlertLifecycle::apply(alert, AlertAction::Escalate, ctx);
                    store_transition(escalated);
                    pending_events.push_back(events::status_changed(alert, escalated,
                                                                    AlertAction::Escalate,
                                                                    ctx.actor, now,
                                                                    settings_.tiers));
                    pending_events.push_back(Auditor::build_audit_event(alert, escalated,
                                                                        AlertAction::Escalate,
                                                                        ctx.actor, now));
                    report.escalated++;
                    spdlog::info("Alert {} auto-escalated to level {} ({})",
                                 escalated.id, escalated.escalation_level,
                                 settings_.tiers.role_for(escalated.escalation_level));
                } catch (const LifecycleError& e) {
                    spdlog::error("Auto-escalation failed: {}", e.what());
                }
            }
        }
    }
    
    emit(pending_events);
    
    if (report.notifications > 0 || report.overdue > 0 || report.escalated > 0) {
        spdlog::debug("Tick: evaluated={}, notifications={}, overdue={}, escalated={}",
                      report.evaluated, report.notifications, report.overdue, report.escalated);
    }
    return report;
}

std::vector<AlertView> EscalationEngine::get_visible(size_t max_visible, TimePoint now) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return make_views(queue_.visible(max_visible), now);
}

std::vector<AlertView> EscalationEngine::get_queued(size_t max_visible, TimePoint now) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return make_views(queue_.queued(max_visible), now);
}

std::optional<AlertView> EscalationEngine::get_alert(const std::string& alert_id,
                                                     TimePoint now) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto alert = queue_.get(alert_id);
    if (!alert) return std::nullopt;
    return make_view(*alert, now);
}

std::vector<AlertView> EscalationEngine::overdue_worklist(TimePoint now) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<AlertView> views;
    for (const auto& alert : queue_.all()) {
        auto it = tracking_.find(alert.id);
        if (it != tracking_.end() && it->second.awaiting_overdue_ack) {
            views.push_back(make_view(alert, now));
        }
    }
    return views;
}

std::vector<AlertView> EscalationEngine::query(const AlertFilter& filter, TimePoint now) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<AlertView> views;
    for (const auto& alert : queue_.all()) {
        if (filter.matches(alert)) {
            views.push_back(make_view(alert, now));
        }
    }
    return views;
}

std::optional<NotificationRecord> EscalationEngine::notification_record(const std::string& alert_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tracking_.find(alert_id);
    if (it == tracking_.end()) return std::nullopt;
    return it->second.notifications;
}

size_t EscalationEngine::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return queue_.size();
}
