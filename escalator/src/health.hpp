#pragma once
#include "redis_bus.hpp"
#include "escalation_engine.hpp"
#include "event_dispatcher.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>

class HealthCheck {
public:
    HealthCheck(std::shared_ptr<RedisBus> redis,
                std::shared_ptr<EscalationEngine> engine,
                std::shared_ptr<EventDispatcher> dispatcher);
    
    nlohmann::json get_status();
    void set_loop_status(const std::string& status);
    void update_last_tick();
    
private:
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<EscalationEngine> engine_;
    std::shared_ptr<EventDispatcher> dispatcher_;
    
    mutable std::mutex mutex_;
    std::string loop_status_ = "idle";
    std::string last_tick_ts_;
};
