#pragma once

#include "types.hpp"
#include <string>
#include <vector>
#include <optional>

// Conjunctive filter over alerts for the query layer. Empty criteria match
// everything.
struct AlertFilter {
    std::vector<Priority> priorities;
    std::vector<AlertStatus> statuses;
    std::vector<std::string> departments;
    std::string search_term;                 // case-insensitive, id/description/room
    std::optional<std::string> assigned_to;
    std::optional<TimePoint> created_after;  // inclusive
    std::optional<TimePoint> created_before; // inclusive
    
    bool matches(const Alert& alert) const;
    bool empty() const;
};
