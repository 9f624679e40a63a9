#pragma once

#include "escalation_engine.hpp"
#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // Redis
    std::string redis_url;
    std::string stream_alerts_in;
    std::string stream_actions_in;
    std::string stream_actions_out;
    std::string stream_notify;
    std::string stream_overdue;
    std::string stream_status;
    std::string stream_audit;
    
    // Escalation thresholds (minutes)
    int threshold_minutes_critical;
    int threshold_minutes_high;
    int threshold_minutes_medium;
    int threshold_minutes_low;
    
    // Escalation tiers: roles by level, capped at max_escalation_tier
    std::vector<std::string> escalation_roles;
    int max_escalation_tier;
    
    // Notifications
    std::vector<int> notify_at;
    bool notify_enabled;
    
    // Queue / engine
    int max_visible;
    bool auto_escalate_on_overdue;
    bool archive_resolved;
    int tick_interval_ms;
    int event_buffer_size;
    
    // HTTP
    std::string listen_addr;
    int listen_port;
    
    // Service
    std::string service_name;
    std::string log_level;
    
    static Config from_env();
    
    // Throws ConfigError on any invariant violation.
    void validate() const;
    
    EngineSettings engine_settings() const;
    
    static std::vector<int> parse_int_list(const std::string& value);
    static std::vector<std::string> parse_string_list(const std::string& value);
    
private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
