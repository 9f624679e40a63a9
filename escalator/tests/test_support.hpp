#pragma once

#include "../src/events.hpp"
#include "../src/types.hpp"
#include "../src/util.hpp"
#include <mutex>
#include <vector>
#include <string>

// Sink that keeps every event it is handed
class RecordingSink : public EventSink {
public:
    void publish(const Event& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }
    
    std::vector<Event> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }
    
    std::vector<Event> of_kind(EventKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Event> out;
        for (const auto& e : events_) {
            if (e.kind == kind) out.push_back(e);
        }
        return out;
    }
    
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }
    
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }
    
private:
    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

inline TimePoint base_time() {
    return util::from_iso8601("2024-01-01T10:00:00Z");
}

inline Alert make_alert(const std::string& id, Priority priority, TimePoint created_at,
                        AlertStatus status = AlertStatus::Pending) {
    Alert alert;
    alert.id = id;
    alert.priority = priority;
    alert.status = status;
    alert.created_at = created_at;
    return alert;
}
