#include "event_dispatcher.hpp"
#include <spdlog/spdlog.h>

EventDispatcher::EventDispatcher(std::shared_ptr<EventSink> downstream, size_t capacity)
    : downstream_(std::move(downstream))
    , capacity_(capacity)
{}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::start() {
    if (running_) return;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = true;
        accepting_ = true;
    }
    worker_ = std::thread(&EventDispatcher::dispatch_loop, this);
    spdlog::info("Event dispatcher started (capacity {})", capacity_);
}

void EventDispatcher::stop() {
    if (!running_) return;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        accepting_ = false;
        running_ = false;
    }
    cv_.notify_all();
    
    if (worker_.joinable()) {
        worker_.join();
    }
    
    spdlog::info("Event dispatcher stopped: delivered={}, failed={}, dropped={}",
                 delivered_.load(), failed_.load(), dropped_.load());
}

void EventDispatcher::publish(const Event& event) {
    {
        // Checked under the lock stop() takes: nothing lands after the drain
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            dropped_++;
            spdlog::warn("Dispatcher not accepting events, dropped {} for alert {}",
                         to_string(event.kind), event.alert_id);
            return;
        }
        if (queue_.size() >= capacity_) {
            dropped_++;
            spdlog::warn("Event buffer full ({}), dropped {} for alert {}",
                         capacity_, to_string(event.kind), event.alert_id);
            return;
        }
        queue_.push_back(event);
    }
    cv_.notify_one();
}

size_t EventDispatcher::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void EventDispatcher::dispatch_loop() {
    while (true) {
        Event event;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
            
            if (queue_.empty()) {
                break;  // stopped and drained
            }
            
            event = std::move(queue_.front());
            queue_.pop_front();
        }
        
        deliver(event);
    }
}

void EventDispatcher::deliver(const Event& event) {
    try {
        downstream_->publish(event);
        delivered_++;
    } catch (const std::exception& e) {
        failed_++;
        spdlog::error("Failed to deliver {} event for alert {}: {}",
                      to_string(event.kind), event.alert_id, e.what());
    }
}
