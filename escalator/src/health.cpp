#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(std::shared_ptr<RedisBus> redis,
                         std::shared_ptr<EscalationEngine> engine,
                         std::shared_ptr<EventDispatcher> dispatcher)
    : redis_(redis), engine_(engine), dispatcher_(dispatcher) {}

void HealthCheck::set_loop_status(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_status_ = status;
}

void HealthCheck::update_last_tick() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_tick_ts_ = util::current_iso8601();
}

nlohmann::json HealthCheck::get_status() {
    bool redis_ok = redis_->ping();
    
    std::string loop_status;
    std::string last_tick;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_status = loop_status_;
        last_tick = last_tick_ts_;
    }
    
    return {
        {"ok", redis_ok && loop_status == "running"},
        {"redis", redis_ok},
        {"loop", loop_status},
        {"last_tick_ts", last_tick},
        {"alerts", engine_->size()},
        {"overdue_worklist", engine_->overdue_worklist(engine_->now()).size()},
        {"events_pending", dispatcher_->pending()},
        {"events_dropped", dispatcher_->dropped()},
        {"events_failed", dispatcher_->failed()}
    };
}
