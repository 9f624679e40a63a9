#include "clock.hpp"

TimePoint SystemClock::now() const {
    return std::chrono::system_clock::now();
}

ManualClock::ManualClock(TimePoint start) : now_(start) {}

TimePoint ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::set(TimePoint tp) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = tp;
}

void ManualClock::advance(std::chrono::milliseconds delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += delta;
}
