#pragma once

#include <chrono>
#include <mutex>

using TimePoint = std::chrono::system_clock::time_point;

// Source of "now" for every time-dependent computation.
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override;
};

// Clock that only moves when told to. Used by tests and replay.
class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start);
    
    TimePoint now() const override;
    void set(TimePoint tp);
    void advance(std::chrono::milliseconds delta);
    
private:
    mutable std::mutex mutex_;
    TimePoint now_;
};
