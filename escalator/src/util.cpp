#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <stdexcept>
#include <ctime>
#include <cctype>

namespace util {

std::string generate_uuid() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static std::uniform_int_distribution<> dis2(8, 11);
    
    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 8; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 4; i++) ss << dis(gen);
    ss << "-4";
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    ss << dis2(gen);
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 12; i++) ss << dis(gen);
    return ss.str();
}

std::string current_iso8601() {
    return to_iso8601(std::chrono::system_clock::now());
}

std::string to_iso8601(std::chrono::system_clock::time_point tp) {
    auto itt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&itt, &tm_utc);
    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%FT%TZ");
    return ss.str();
}

std::chrono::system_clock::time_point from_iso8601(const std::string& iso8601) {
    std::tm tm_utc{};
    std::istringstream ss(iso8601);
    ss >> std::get_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: " + iso8601);
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm_utc));
}

int64_t to_timestamp_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count();
}

std::chrono::system_clock::time_point from_timestamp_ms(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

std::string trim(const std::string& str) {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) start++;
    if (start == str.end()) return "";
    
    auto end = str.end();
    do { end--; } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));
    
    return std::string(start, end + 1);
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string to_upper(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        tokens.push_back(token);
    }
    return tokens;
}

} // namespace util
