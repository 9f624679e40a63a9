#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>
#include <vector>

// Thrown at startup when configuration would corrupt ordering semantics.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Lower weight sorts first.
int priority_weight(Priority priority);
int status_weight(AlertStatus status);

struct EscalationThresholds {
    int critical_minutes = 15;
    int high_minutes = 30;
    int medium_minutes = 60;
    int low_minutes = 120;
    
    int minutes_for(Priority priority) const;
    
    // Requires critical < high < medium < low, all positive.
    void validate() const;
};

// Who is paged at each escalation level. Level N maps to roles[N - 1]; the
// table size is the highest level an alert can reach.
struct EscalationTiers {
    std::vector<std::string> roles = {"nurse", "doctor", "head_doctor"};
    
    int max_tier() const { return static_cast<int>(roles.size()); }
    bool can_escalate(int level) const { return level < max_tier(); }
    
    // Empty when the level is outside the table.
    std::string role_for(int level) const;
    
    // Requires at least one role and no empty role names.
    void validate() const;
};
