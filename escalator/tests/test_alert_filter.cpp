#include <catch2/catch_test_macros.hpp>
#include "../src/alert_filter.hpp"
#include "test_support.hpp"

using namespace std::chrono;

namespace {

std::vector<Alert> sample_alerts() {
    Alert a1 = make_alert("ALT001", Priority::Critical, util::from_iso8601("2024-01-01T10:00:00Z"));
    a1.metadata.department = "Emergency";
    a1.metadata.description = "Cardiac arrest";
    a1.metadata.room_number = "12";
    a1.assigned_to = {"user1"};
    
    Alert a2 = make_alert("ALT002", Priority::High, util::from_iso8601("2024-01-01T11:00:00Z"),
                          AlertStatus::Acknowledged);
    a2.metadata.department = "ICU";
    a2.metadata.description = "Oxygen saturation low";
    a2.metadata.room_number = "4B";
    a2.assigned_to = {"user2"};
    
    Alert a3 = make_alert("ALT003", Priority::Medium, util::from_iso8601("2024-01-01T12:00:00Z"));
    a3.metadata.department = "Emergency";
    a3.metadata.description = "Fall risk";
    
    return {a1, a2, a3};
}

std::vector<std::string> matching(const AlertFilter& filter) {
    std::vector<std::string> out;
    for (const auto& a : sample_alerts()) {
        if (filter.matches(a)) out.push_back(a.id);
    }
    return out;
}

} // namespace

TEST_CASE("Alert filtering", "[filter]") {
    SECTION("Empty filter matches everything") {
        AlertFilter filter;
        REQUIRE(filter.empty());
        REQUIRE(matching(filter).size() == 3);
    }
    
    SECTION("By priority") {
        AlertFilter filter;
        filter.priorities = {Priority::Critical, Priority::High};
        REQUIRE(matching(filter) == std::vector<std::string>{"ALT001", "ALT002"});
    }
    
    SECTION("By status") {
        AlertFilter filter;
        filter.statuses = {AlertStatus::Pending};
        REQUIRE(matching(filter) == std::vector<std::string>{"ALT001", "ALT003"});
    }
    
    SECTION("By department") {
        AlertFilter filter;
        filter.departments = {"Emergency"};
        REQUIRE(matching(filter) == std::vector<std::string>{"ALT001", "ALT003"});
    }
    
    SECTION("Search is case-insensitive over id, description and room") {
        AlertFilter filter;
        filter.search_term = "oxygen";
        REQUIRE(matching(filter) == std::vector<std::string>{"ALT002"});
        
        filter.search_term = "alt003";
        REQUIRE(matching(filter) == std::vector<std::string>{"ALT003"});
        
        filter.search_term = "4b";
        REQUIRE(matching(filter) == std::vector<std::string>{"ALT002"});
    }
    
    SECTION("By assignee") {
        AlertFilter filter;
        filter.assigned_to = "user1";
        REQUIRE(matching(filter) == std::vector<std::string>{"ALT001"});
    }
    
    SECTION("By creation range") {
        AlertFilter filter;
        filter.created_after = util::from_iso8601("2024-01-01T10:30:00Z");
        filter.created_before = util::from_iso8601("2024-01-01T12:00:00Z");
        REQUIRE(matching(filter) == std::vector<std::string>{"ALT002", "ALT003"});
    }
    
    SECTION("Criteria combine") {
        AlertFilter filter;
        filter.priorities = {Priority::Critical, Priority::High};
        filter.statuses = {AlertStatus::Pending};
        filter.departments = {"Emergency"};
        REQUIRE(matching(filter) == std::vector<std::string>{"ALT001"});
    }
}
