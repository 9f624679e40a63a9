#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <random>

namespace util {
    std::string generate_uuid();
    std::string current_iso8601();
    std::string to_iso8601(std::chrono::system_clock::time_point tp);
    std::chrono::system_clock::time_point from_iso8601(const std::string& iso8601);
    int64_t to_timestamp_ms(std::chrono::system_clock::time_point tp);
    std::chrono::system_clock::time_point from_timestamp_ms(int64_t ms);
    std::string trim(const std::string& str);
    std::string to_lower(const std::string& str);
    std::string to_upper(const std::string& str);
    std::vector<std::string> split(const std::string& str, char delim);
}
