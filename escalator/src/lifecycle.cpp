#include "lifecycle.hpp"
#include "util.hpp"
#include <algorithm>
#include <fmt/format.h>

std::string to_string(AlertAction action) {
    switch (action) {
        case AlertAction::Acknowledge: return "acknowledge";
        case AlertAction::Escalate: return "escalate";
        case AlertAction::Dismiss: return "dismiss";
        case AlertAction::Resolve: return "resolve";
        case AlertAction::Reassign: return "reassign";
        case AlertAction::AcknowledgeOverdue: return "acknowledge_overdue";
    }
    return "unknown";
}

AlertAction parse_action(const std::string& value) {
    std::string v = util::to_lower(util::trim(value));
    std::replace(v.begin(), v.end(), '-', '_');
    if (v == "acknowledge") return AlertAction::Acknowledge;
    if (v == "escalate") return AlertAction::Escalate;
    if (v == "dismiss") return AlertAction::Dismiss;
    if (v == "resolve") return AlertAction::Resolve;
    if (v == "reassign") return AlertAction::Reassign;
    if (v == "acknowledge_overdue") return AlertAction::AcknowledgeOverdue;
    throw std::invalid_argument("Unknown action: " + value);
}

nlohmann::json to_json(const std::vector<ActionDescriptor>& actions) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& a : actions) {
        arr.push_back({
            {"action", to_string(a.action)},
            {"requires_confirmation", a.requires_confirmation}
        });
    }
    return arr;
}

LifecycleError::LifecycleError(LifecycleErrorKind kind, std::string alert_id,
                               const std::string& message,
                               std::vector<ActionDescriptor> valid_actions)
    : std::runtime_error(message)
    , kind_(kind)
    , alert_id_(std::move(alert_id))
    , valid_actions_(std::move(valid_actions))
{}

LifecycleError LifecycleError::invalid_transition(const Alert& alert, AlertAction action,
                                                  std::vector<ActionDescriptor> valid_actions,
                                                  const std::string& detail) {
    std::string message = fmt::format("Action {} not allowed for alert {} in status {}",
                                      to_string(action), alert.id, to_string(alert.status));
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return LifecycleError(LifecycleErrorKind::InvalidTransition, alert.id, message,
                          std::move(valid_actions));
}

LifecycleError LifecycleError::unknown_alert(const std::string& alert_id) {
    return LifecycleError(LifecycleErrorKind::UnknownAlert, alert_id,
                          "Unknown alert: " + alert_id);
}

nlohmann::json LifecycleError::to_json() const {
    return {
        {"ok", false},
        {"error", kind_ == LifecycleErrorKind::InvalidTransition ? "invalid_transition"
                                                                  : "unknown_alert"},
        {"message", what()},
        {"alert_id", alert_id_},
        {"valid_actions", ::to_json(valid_actions_)}
    };
}

std::optional<AlertStatus> AlertLifecycle::target_status(AlertStatus from, AlertAction action) {
    if (action == AlertAction::AcknowledgeOverdue) {
        if (from == AlertStatus::Resolved) return std::nullopt;
        return from;
    }
    
    switch (from) {
        case AlertStatus::Pending:
            if (action == AlertAction::Acknowledge) return AlertStatus::Acknowledged;
            if (action == AlertAction::Escalate) return AlertStatus::Escalated;
            if (action == AlertAction::Dismiss) return AlertStatus::Resolved;
            break;
        case AlertStatus::Acknowledged:
            if (action == AlertAction::Resolve) return AlertStatus::Resolved;
            if (action == AlertAction::Reassign) return AlertStatus::Acknowledged;
            break;
        case AlertStatus::Escalated:
            if (action == AlertAction::Acknowledge) return AlertStatus::Acknowledged;
            break;
        case AlertStatus::Resolved:
            break;
    }
    return std::nullopt;
}

bool AlertLifecycle::is_allowed(const Alert& alert, AlertAction action, bool overdue,
                                const EscalationTiers& tiers) {
    if (!target_status(alert.status, action)) return false;
    
    switch (action) {
        case AlertAction::Escalate:
            if (!tiers.can_escalate(alert.escalation_level)) return false;
            return alert.priority == Priority::High ||
                   alert.priority == Priority::Critical ||
                   overdue;
        case AlertAction::AcknowledgeOverdue:
            return overdue;
        default:
            return true;
    }
}

std::vector<ActionDescriptor> AlertLifecycle::available_actions(const Alert& alert, bool overdue,
                                                                const EscalationTiers& tiers) {
    static const AlertAction all_actions[] = {
        AlertAction::Acknowledge,
        AlertAction::Escalate,
        AlertAction::Dismiss,
        AlertAction::Resolve,
        AlertAction::Reassign,
        AlertAction::AcknowledgeOverdue
    };
    
    std::vector<ActionDescriptor> actions;
    for (AlertAction action : all_actions) {
        if (is_allowed(alert, action, overdue, tiers)) {
            bool confirm = action == AlertAction::Escalate || action == AlertAction::Dismiss;
            actions.push_back({action, confirm});
        }
    }
    return actions;
}

Alert AlertLifecycle::apply(const Alert& alert, AlertAction action, const ActionContext& ctx) {
    if (!is_allowed(alert, action, ctx.overdue, ctx.tiers)) {
        std::string detail;
        if (action == AlertAction::Escalate && target_status(alert.status, action) &&
            !ctx.tiers.can_escalate(alert.escalation_level)) {
            detail = fmt::format("already at the highest tier ({})",
                                 ctx.tiers.role_for(ctx.tiers.max_tier()));
        }
        throw LifecycleError::invalid_transition(alert, action,
                                                 available_actions(alert, ctx.overdue, ctx.tiers),
                                                 detail);
    }
    if (action == AlertAction::Dismiss && !ctx.confirmed) {
        throw LifecycleError::invalid_transition(alert, action,
                                                 available_actions(alert, ctx.overdue, ctx.tiers),
                                                 "confirmation required");
    }
    
    Alert updated = alert;
    
    switch (action) {
        case AlertAction::Acknowledge:
            updated.status = AlertStatus::Acknowledged;
            if (!updated.acknowledged_at) {
                updated.acknowledged_at = ctx.now;
            }
            break;
            
        case AlertAction::Escalate:
            updated.status = AlertStatus::Escalated;
            updated.escalations.push_back({
                updated.escalation_level,
                updated.escalation_level + 1,
                ctx.tiers.role_for(updated.escalation_level),
                ctx.tiers.role_for(updated.escalation_level + 1),
                ctx.reason,
                ctx.actor,
                ctx.now
            });
            updated.escalation_level += 1;
            break;
            
        case AlertAction::Dismiss:
        case AlertAction::Resolve:
            updated.status = AlertStatus::Resolved;
            if (!updated.resolved_at) {
                updated.resolved_at = ctx.now;
            }
            break;
            
        case AlertAction::Reassign:
            updated.assigned_to = ctx.assignees;
            break;
            
        case AlertAction::AcknowledgeOverdue:
            break;
    }
    
    return updated;
}
