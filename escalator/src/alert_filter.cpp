#include "alert_filter.hpp"
#include "util.hpp"
#include <algorithm>

bool AlertFilter::empty() const {
    return priorities.empty() && statuses.empty() && departments.empty() &&
           search_term.empty() && !assigned_to && !created_after && !created_before;
}

bool AlertFilter::matches(const Alert& alert) const {
    if (!priorities.empty() &&
        std::find(priorities.begin(), priorities.end(), alert.priority) == priorities.end()) {
        return false;
    }
    
    if (!statuses.empty() &&
        std::find(statuses.begin(), statuses.end(), alert.status) == statuses.end()) {
        return false;
    }
    
    if (!departments.empty() &&
        std::find(departments.begin(), departments.end(), alert.metadata.department) == departments.end()) {
        return false;
    }
    
    if (!search_term.empty()) {
        std::string needle = util::to_lower(search_term);
        bool hit = util::to_lower(alert.id).find(needle) != std::string::npos ||
                   util::to_lower(alert.metadata.description).find(needle) != std::string::npos ||
                   util::to_lower(alert.metadata.room_number).find(needle) != std::string::npos;
        if (!hit) return false;
    }
    
    if (assigned_to &&
        std::find(alert.assigned_to.begin(), alert.assigned_to.end(), *assigned_to) == alert.assigned_to.end()) {
        return false;
    }
    
    if (created_after && alert.created_at < *created_after) return false;
    if (created_before && alert.created_at > *created_before) return false;
    
    return true;
}
