#pragma once

#include "events.hpp"
#include <memory>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <deque>

// Buffers engine events and delivers them to a downstream sink on its own
// thread. publish() never blocks: when the buffer is full the event is
// dropped and counted.
class EventDispatcher : public EventSink {
public:
    EventDispatcher(std::shared_ptr<EventSink> downstream, size_t capacity);
    ~EventDispatcher() override;
    
    void start();
    
    // Stops accepting events and delivers whatever is already buffered.
    void stop();
    
    void publish(const Event& event) override;
    
    size_t pending() const;
    uint64_t dropped() const { return dropped_; }
    uint64_t delivered() const { return delivered_; }
    uint64_t failed() const { return failed_; }
    bool is_running() const { return running_; }
    
private:
    void dispatch_loop();
    void deliver(const Event& event);
    
    std::shared_ptr<EventSink> downstream_;
    size_t capacity_;
    
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    
    std::atomic<bool> running_{false};
    std::atomic<bool> accepting_{false};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
    std::thread worker_;
};
