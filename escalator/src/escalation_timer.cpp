#include "escalation_timer.hpp"
#include <fmt/format.h>
#include <algorithm>

std::string to_string(SeverityBand band) {
    switch (band) {
        case SeverityBand::Normal: return "normal";
        case SeverityBand::Warning: return "warning";
        case SeverityBand::Critical: return "critical";
        case SeverityBand::Overdue: return "overdue";
    }
    return "unknown";
}

nlohmann::json TimerState::to_json() const {
    return {
        {"remaining_seconds", remaining_seconds},
        {"threshold_minutes", threshold_minutes},
        {"percentage_remaining", percentage_remaining},
        {"progress_percentage", progress_percentage},
        {"band", to_string(band)},
        {"display", display},
        {"label", label}
    };
}

TimePoint EscalationTimer::deadline(const Alert& alert, int threshold_minutes) {
    return alert.created_at + std::chrono::minutes(threshold_minutes);
}

TimerState EscalationTimer::compute(const Alert& alert, int threshold_minutes, TimePoint now) {
    TimerState state;
    state.threshold_minutes = threshold_minutes;
    
    auto remaining_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline(alert, threshold_minutes) - now
    ).count();
    
    // Floored: the last partial second before the deadline already reads 0
    int64_t remaining_s = remaining_ms / 1000;
    if (remaining_ms < 0 && remaining_ms % 1000 != 0) {
        remaining_s -= 1;
    }
    state.remaining_seconds = remaining_s;
    
    double total_ms = static_cast<double>(threshold_minutes) * 60.0 * 1000.0;
    double raw_pct = total_ms > 0 ? (static_cast<double>(remaining_ms) / total_ms) * 100.0 : 0.0;
    
    if (remaining_s <= 0) {
        state.percentage_remaining = 0.0;
        state.progress_percentage = 100.0;
    } else {
        state.percentage_remaining = std::clamp(raw_pct, 0.0, 100.0);
        state.progress_percentage = std::clamp(100.0 - raw_pct, 0.0, 100.0);
    }
    
    state.band = band_for(remaining_s, state.percentage_remaining);
    state.display = format_display(remaining_s);
    
    if (state.band == SeverityBand::Overdue) {
        state.label = "Escalation required";
    } else if (remaining_s < 60) {
        state.label = "Escalating soon";
    } else {
        state.label = "Time remaining";
    }
    
    return state;
}

SeverityBand EscalationTimer::band_for(int64_t remaining_seconds, double percentage_remaining) {
    if (remaining_seconds <= 0) return SeverityBand::Overdue;
    if (percentage_remaining <= 25.0) return SeverityBand::Critical;
    if (percentage_remaining <= 50.0) return SeverityBand::Warning;
    return SeverityBand::Normal;
}

std::string EscalationTimer::format_display(int64_t remaining_seconds) {
    if (remaining_seconds <= 0) {
        return OVERDUE_DISPLAY;
    }
    
    int64_t minutes = remaining_seconds / 60;
    int64_t seconds = remaining_seconds % 60;
    
    if (remaining_seconds >= 3600) {
        return fmt::format("{}h {}m", minutes / 60, minutes % 60);
    }
    if (minutes == 0) {
        return fmt::format("{}s", seconds);
    }
    return fmt::format("{}:{:02d}", minutes, seconds);
}
