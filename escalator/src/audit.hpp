#pragma once
#include "events.hpp"
#include <string>

class Auditor {
public:
    static Event build_audit_event(const Alert& before, const Alert& after,
                                   AlertAction action, const std::string& actor,
                                   TimePoint at);
};
