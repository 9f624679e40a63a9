#pragma once

#include "types.hpp"
#include <string>
#include <nlohmann/json.hpp>

enum class SeverityBand {
    Normal,
    Warning,
    Critical,
    Overdue
};

std::string to_string(SeverityBand band);

struct TimerState {
    int64_t remaining_seconds;      // negative when overdue
    int threshold_minutes;
    double percentage_remaining;    // clamped to [0, 100]
    double progress_percentage;     // elapsed share, clamped to [0, 100]
    SeverityBand band;
    std::string display;            // "2h 5m", "5:45", "30s" or "OVERDUE"
    std::string label;
    
    bool is_overdue() const { return band == SeverityBand::Overdue; }
    int64_t overdue_seconds() const { return remaining_seconds < 0 ? -remaining_seconds : 0; }
    
    nlohmann::json to_json() const;
};

class EscalationTimer {
public:
    static constexpr const char* OVERDUE_DISPLAY = "OVERDUE";
    
    static TimePoint deadline(const Alert& alert, int threshold_minutes);
    static TimerState compute(const Alert& alert, int threshold_minutes, TimePoint now);
    static std::string format_display(int64_t remaining_seconds);
    
private:
    static SeverityBand band_for(int64_t remaining_seconds, double percentage_remaining);
};
