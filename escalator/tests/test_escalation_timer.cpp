#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/escalation_timer.hpp"
#include "../src/priority.hpp"
#include "test_support.hpp"

using namespace std::chrono;

TEST_CASE("Escalation deadline", "[timer]") {
    Alert alert = make_alert("a1", Priority::High, base_time());
    
    REQUIRE(EscalationTimer::deadline(alert, 30) == base_time() + minutes(30));
    
    EscalationThresholds thresholds;
    REQUIRE(thresholds.minutes_for(Priority::High) == 30);
    REQUIRE(EscalationTimer::deadline(alert, thresholds.minutes_for(alert.priority)) ==
            util::from_iso8601("2024-01-01T10:30:00Z"));
}

TEST_CASE("Remaining time and severity band", "[timer]") {
    Alert alert = make_alert("a1", Priority::High, base_time());
    
    SECTION("Ample time is normal") {
        auto state = EscalationTimer::compute(alert, 30, base_time() + minutes(10));
        REQUIRE(state.remaining_seconds == 1200);
        REQUIRE(state.percentage_remaining == Catch::Approx(66.666).epsilon(0.001));
        REQUIRE(state.band == SeverityBand::Normal);
        REQUIRE(state.display == "20:00");
        REQUIRE(state.label == "Time remaining");
    }
    
    SECTION("Half the budget left is warning") {
        auto state = EscalationTimer::compute(alert, 30, base_time() + minutes(15));
        REQUIRE(state.percentage_remaining == Catch::Approx(50.0));
        REQUIRE(state.progress_percentage == Catch::Approx(50.0));
        REQUIRE(state.band == SeverityBand::Warning);
    }
    
    SECTION("A quarter or less is critical") {
        auto state = EscalationTimer::compute(alert, 30, base_time() + minutes(23));
        REQUIRE(state.remaining_seconds == 420);
        REQUIRE(state.band == SeverityBand::Critical);
        REQUIRE(state.display == "7:00");
    }
    
    SECTION("Deadline reached is overdue") {
        auto state = EscalationTimer::compute(alert, 30, base_time() + minutes(30));
        REQUIRE(state.remaining_seconds == 0);
        REQUIRE(state.is_overdue());
        REQUIRE(state.percentage_remaining == 0.0);
        REQUIRE(state.progress_percentage == 100.0);
        REQUIRE(state.display == "OVERDUE");
        REQUIRE(state.label == "Escalation required");
    }
    
    SECTION("Past the deadline keeps the sign") {
        auto state = EscalationTimer::compute(alert, 30, base_time() + minutes(45));
        REQUIRE(state.remaining_seconds == -900);
        REQUIRE(state.overdue_seconds() == 900);
        REQUIRE(state.percentage_remaining == 0.0);
        REQUIRE(state.display == "OVERDUE");
    }
    
    SECTION("Sub-second overrun already counts as overdue") {
        auto state = EscalationTimer::compute(alert, 30,
                                              base_time() + minutes(30) + milliseconds(500));
        REQUIRE(state.remaining_seconds == -1);
        REQUIRE(state.is_overdue());
    }
    
    SECTION("Last partial second before the deadline reads as overdue") {
        auto state = EscalationTimer::compute(alert, 30,
                                              base_time() + minutes(30) - milliseconds(500));
        REQUIRE(state.remaining_seconds == 0);
        REQUIRE(state.is_overdue());
        REQUIRE(state.band == SeverityBand::Overdue);
        REQUIRE(state.display == "OVERDUE");
    }
    
    SECTION("A full second before the deadline is still running") {
        auto state = EscalationTimer::compute(alert, 30,
                                              base_time() + minutes(30) - milliseconds(1000));
        REQUIRE(state.remaining_seconds == 1);
        REQUIRE_FALSE(state.is_overdue());
    }
    
    SECTION("Clock behind creation clamps percentage") {
        auto state = EscalationTimer::compute(alert, 30, base_time() - minutes(5));
        REQUIRE(state.percentage_remaining == 100.0);
        REQUIRE(state.progress_percentage == 0.0);
        REQUIRE(state.band == SeverityBand::Normal);
    }
}

TEST_CASE("Timer display formatting", "[timer]") {
    SECTION("Hours for long durations") {
        REQUIRE(EscalationTimer::format_display(125 * 60 + 30) == "2h 5m");
        REQUIRE(EscalationTimer::format_display(3600) == "1h 0m");
    }
    
    SECTION("Minutes and zero-padded seconds") {
        REQUIRE(EscalationTimer::format_display(5 * 60 + 45) == "5:45");
        REQUIRE(EscalationTimer::format_display(5 * 60) == "5:00");
        REQUIRE(EscalationTimer::format_display(59 * 60 + 59) == "59:59");
    }
    
    SECTION("Seconds only under a minute") {
        REQUIRE(EscalationTimer::format_display(30) == "30s");
        REQUIRE(EscalationTimer::format_display(1) == "1s");
    }
    
    SECTION("Overdue is a fixed literal") {
        REQUIRE(EscalationTimer::format_display(0) == "OVERDUE");
        REQUIRE(EscalationTimer::format_display(-1) == "OVERDUE");
        REQUIRE(EscalationTimer::format_display(-86400) == "OVERDUE");
    }
    
    SECTION("Under a minute is labelled as imminent") {
        Alert alert = make_alert("a1", Priority::Critical, base_time());
        auto state = EscalationTimer::compute(alert, 15, base_time() + minutes(14) + seconds(30));
        REQUIRE(state.display == "30s");
        REQUIRE(state.label == "Escalating soon");
    }
}

TEST_CASE("More urgent priorities go overdue first", "[timer]") {
    EscalationThresholds thresholds;
    const Priority priorities[] = {Priority::Critical, Priority::High, Priority::Medium, Priority::Low};
    
    for (Priority p1 : priorities) {
        for (Priority p2 : priorities) {
            if (thresholds.minutes_for(p1) >= thresholds.minutes_for(p2)) continue;
            
            Alert a1 = make_alert("a1", p1, base_time());
            Alert a2 = make_alert("a2", p2, base_time());
            
            // At p1's deadline p1 is overdue and p2 is not
            TimePoint at = base_time() + minutes(thresholds.minutes_for(p1));
            REQUIRE(EscalationTimer::compute(a1, thresholds.minutes_for(p1), at).is_overdue());
            REQUIRE_FALSE(EscalationTimer::compute(a2, thresholds.minutes_for(p2), at).is_overdue());
        }
    }
}
