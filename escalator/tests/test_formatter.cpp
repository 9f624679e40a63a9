#include <catch2/catch_test_macros.hpp>
#include "../src/formatter.hpp"
#include "test_support.hpp"

using namespace std::chrono;

namespace {

Alert icu_alert() {
    Alert alert = make_alert("a1", Priority::High, base_time());
    alert.metadata.department = "ICU";
    alert.metadata.room_number = "12";
    return alert;
}

} // namespace

TEST_CASE("Notification text", "[formatter]") {
    Alert alert = icu_alert();
    
    SECTION("Remaining time") {
        auto timer = EscalationTimer::compute(alert, 30, base_time() + seconds(22 * 60 + 30));
        NotificationDecision decision{25, NotificationClass::Critical};
        REQUIRE(AlertFormatter::format_notification(alert, decision, timer) ==
                "[CRITICAL] high alert a1 (ICU room 12): 7:30 remaining");
    }
    
    SECTION("Deadline passed") {
        auto timer = EscalationTimer::compute(alert, 30, base_time() + minutes(31));
        NotificationDecision decision{10, NotificationClass::Critical};
        REQUIRE(AlertFormatter::format_notification(alert, decision, timer) ==
                "[CRITICAL] high alert a1 (ICU room 12): escalation deadline passed");
    }
    
    SECTION("Partial location") {
        alert.metadata.room_number.clear();
        auto timer = EscalationTimer::compute(alert, 30, base_time() + minutes(15));
        NotificationDecision decision{50, NotificationClass::Warning};
        REQUIRE(AlertFormatter::format_notification(alert, decision, timer) ==
                "[WARNING] high alert a1 (ICU): 15:00 remaining");
    }
}

TEST_CASE("Overdue text", "[formatter]") {
    Alert alert = icu_alert();
    auto timer = EscalationTimer::compute(alert, 30, base_time() + minutes(31) + seconds(5));
    REQUIRE(AlertFormatter::format_overdue(alert, timer) ==
            "[OVERDUE] high alert a1 (ICU room 12): overdue by 1m 5s, escalation required");
}

TEST_CASE("Duration formatting", "[formatter]") {
    REQUIRE(AlertFormatter::format_duration(0) == "0s");
    REQUIRE(AlertFormatter::format_duration(59) == "59s");
    REQUIRE(AlertFormatter::format_duration(61) == "1m 1s");
    REQUIRE(AlertFormatter::format_duration(3720) == "1h 2m");
}
