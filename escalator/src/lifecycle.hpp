#pragma once

#include "types.hpp"
#include "priority.hpp"
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

enum class AlertAction {
    Acknowledge,
    Escalate,
    Dismiss,
    Resolve,
    Reassign,
    AcknowledgeOverdue
};

std::string to_string(AlertAction action);
AlertAction parse_action(const std::string& value);

struct ActionDescriptor {
    AlertAction action;
    bool requires_confirmation;
    
    bool operator==(const ActionDescriptor& other) const {
        return action == other.action && requires_confirmation == other.requires_confirmation;
    }
};

nlohmann::json to_json(const std::vector<ActionDescriptor>& actions);

enum class LifecycleErrorKind {
    InvalidTransition,
    UnknownAlert
};

class LifecycleError : public std::runtime_error {
public:
    LifecycleError(LifecycleErrorKind kind, std::string alert_id, const std::string& message,
                   std::vector<ActionDescriptor> valid_actions = {});
    
    static LifecycleError invalid_transition(const Alert& alert, AlertAction action,
                                             std::vector<ActionDescriptor> valid_actions,
                                             const std::string& detail = "");
    static LifecycleError unknown_alert(const std::string& alert_id);
    
    LifecycleErrorKind kind() const { return kind_; }
    const std::string& alert_id() const { return alert_id_; }
    const std::vector<ActionDescriptor>& valid_actions() const { return valid_actions_; }
    
    nlohmann::json to_json() const;
    
private:
    LifecycleErrorKind kind_;
    std::string alert_id_;
    std::vector<ActionDescriptor> valid_actions_;
};

struct ActionContext {
    TimePoint now;
    bool overdue = false;
    bool confirmed = false;
    std::string actor;
    std::string reason = "manual";
    std::vector<std::string> assignees;
    EscalationTiers tiers;
};

// Single authority over which operator actions are legal in which status.
class AlertLifecycle {
public:
    static std::vector<ActionDescriptor> available_actions(const Alert& alert, bool overdue,
                                                           const EscalationTiers& tiers);
    
    // Escalation also needs a higher tier to escalate to.
    static bool is_allowed(const Alert& alert, AlertAction action, bool overdue,
                           const EscalationTiers& tiers);
    
    // Status the action leads to, or nullopt if the pair is not in the table.
    // AcknowledgeOverdue maps to the unchanged status.
    static std::optional<AlertStatus> target_status(AlertStatus from, AlertAction action);
    
    // Returns the transitioned copy. Throws LifecycleError and leaves
    // the input untouched when the action is not allowed.
    static Alert apply(const Alert& alert, AlertAction action, const ActionContext& ctx);
};
