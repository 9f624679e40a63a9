#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <set>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    
    std::string v = util::to_lower(util::trim(val));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    
    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}

std::vector<int> Config::parse_int_list(const std::string& value) {
    std::vector<int> result;
    for (const auto& token : util::split(value, ',')) {
        std::string t = util::trim(token);
        if (t.empty()) continue;
        try {
            result.push_back(std::stoi(t));
        } catch (const std::exception&) {
            throw ConfigError("Invalid integer in list: " + t);
        }
    }
    return result;
}

std::vector<std::string> Config::parse_string_list(const std::string& value) {
    std::vector<std::string> result;
    for (const auto& token : util::split(value, ',')) {
        std::string t = util::trim(token);
        if (!t.empty()) result.push_back(t);
    }
    return result;
}

Config Config::from_env() {
    Config cfg;
    
    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_alerts_in = get_env("STREAM_ALERTS_IN", "escalator.alerts.in");
    cfg.stream_actions_in = get_env("STREAM_ACTIONS_IN", "escalator.actions.in");
    cfg.stream_actions_out = get_env("STREAM_ACTIONS_OUT", "escalator.actions.out");
    cfg.stream_notify = get_env("STREAM_NOTIFY", "escalator.notify");
    cfg.stream_overdue = get_env("STREAM_OVERDUE", "escalator.overdue");
    cfg.stream_status = get_env("STREAM_STATUS", "escalator.status");
    cfg.stream_audit = get_env("STREAM_AUDIT", "escalator.audit");
    
    cfg.threshold_minutes_critical = get_env_int("THRESHOLD_MINUTES_CRITICAL", 15);
    cfg.threshold_minutes_high = get_env_int("THRESHOLD_MINUTES_HIGH", 30);
    cfg.threshold_minutes_medium = get_env_int("THRESHOLD_MINUTES_MEDIUM", 60);
    cfg.threshold_minutes_low = get_env_int("THRESHOLD_MINUTES_LOW", 120);
    
    cfg.escalation_roles = parse_string_list(get_env("ESCALATION_ROLES", "nurse,doctor,head_doctor"));
    cfg.max_escalation_tier = get_env_int("MAX_ESCALATION_TIER", 3);
    
    cfg.notify_at = parse_int_list(get_env("NOTIFY_AT", "50,25,10"));
    cfg.notify_enabled = get_env_bool("NOTIFY_ENABLED", true);
    
    cfg.max_visible = get_env_int("MAX_VISIBLE", 3);
    cfg.auto_escalate_on_overdue = get_env_bool("AUTO_ESCALATE_ON_OVERDUE", true);
    cfg.archive_resolved = get_env_bool("ARCHIVE_RESOLVED", true);
    cfg.tick_interval_ms = get_env_int("TICK_INTERVAL_MS", 1000);
    cfg.event_buffer_size = get_env_int("EVENT_BUFFER_SIZE", 1024);
    
    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);
    
    cfg.service_name = get_env("SERVICE_NAME", "escalator");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    
    return cfg;
}

EngineSettings Config::engine_settings() const {
    EngineSettings settings;
    settings.thresholds.critical_minutes = threshold_minutes_critical;
    settings.thresholds.high_minutes = threshold_minutes_high;
    settings.thresholds.medium_minutes = threshold_minutes_medium;
    settings.thresholds.low_minutes = threshold_minutes_low;
    settings.tiers.roles.assign(
        escalation_roles.begin(),
        escalation_roles.begin() + std::clamp(max_escalation_tier, 0,
                                              static_cast<int>(escalation_roles.size())));
    settings.notifications.enabled = notify_enabled;
    settings.notifications.thresholds = notify_at;
    settings.max_visible = static_cast<size_t>(std::max(0, max_visible));
    settings.auto_escalate_on_overdue = auto_escalate_on_overdue;
    settings.archive_resolved = archive_resolved;
    return settings;
}

void Config::validate() const {
    engine_settings().thresholds.validate();
    
    if (max_escalation_tier < 1 ||
        max_escalation_tier > static_cast<int>(escalation_roles.size())) {
        throw ConfigError(fmt::format(
            "MAX_ESCALATION_TIER {} must be between 1 and the {} configured ESCALATION_ROLES",
            max_escalation_tier, escalation_roles.size()));
    }
    
    std::set<int> seen;
    for (int pct : notify_at) {
        if (pct <= 0 || pct > 100) {
            throw ConfigError(fmt::format("NOTIFY_AT checkpoint {} outside (0, 100]", pct));
        }
        if (!seen.insert(pct).second) {
            throw ConfigError(fmt::format("NOTIFY_AT checkpoint {} listed twice", pct));
        }
    }
    
    if (max_visible < 0) {
        throw ConfigError("MAX_VISIBLE must not be negative");
    }
    if (tick_interval_ms <= 0) {
        throw ConfigError("TICK_INTERVAL_MS must be positive");
    }
    if (event_buffer_size <= 0) {
        throw ConfigError("EVENT_BUFFER_SIZE must be positive");
    }
    
    spdlog::info("Configuration validated successfully");
    spdlog::info("  Thresholds (min): critical={}, high={}, medium={}, low={}",
                 threshold_minutes_critical, threshold_minutes_high,
                 threshold_minutes_medium, threshold_minutes_low);
    spdlog::info("  Escalation tiers: {} (max {})",
                 fmt::join(escalation_roles, " -> "), max_escalation_tier);
    spdlog::info("  Notify at: {} (enabled={})", fmt::join(notify_at, ","), notify_enabled);
    spdlog::info("  Max visible: {}, auto-escalate: {}, tick: {}ms",
                 max_visible, auto_escalate_on_overdue, tick_interval_ms);
}
