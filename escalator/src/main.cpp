#include "config.hpp"
#include "clock.hpp"
#include "redis_bus.hpp"
#include "event_dispatcher.hpp"
#include "escalation_engine.hpp"
#include "health.hpp"
#include "query_server.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>
#include <algorithm>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("escalator", console_sink);
    
    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }
    
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

// Intake consumer: new alert records from the intake collaborator
void alert_consumer_loop(RedisBus& redis,
                         EscalationEngine& engine,
                         const Config& config,
                         std::atomic<bool>& running) {
    
    spdlog::info("Starting alert intake consumer");
    redis.create_consumer_group(config.stream_alerts_in, "escalator");
    
    while (running) {
        try {
            auto messages = redis.read_messages(config.stream_alerts_in, "escalator",
                                                "consumer1", 10, 1000);
            
            for (const auto& [msg_id, alert_json] : messages) {
                try {
                    engine.add_alert(Alert::from_json(alert_json));
                } catch (const std::exception& e) {
                    spdlog::error("Rejected alert record {}: {}", msg_id, e.what());
                }
                redis.ack_message(config.stream_alerts_in, "escalator", msg_id);
            }
            
        } catch (const std::exception& e) {
            spdlog::error("Alert consumer error: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
    
    spdlog::info("Alert intake consumer stopped");
}

// Action consumer: operator actions, each answered on the reply stream
void action_consumer_loop(RedisBus& redis,
                          EscalationEngine& engine,
                          const Config& config,
                          std::atomic<bool>& running) {
    
    spdlog::info("Starting action consumer");
    redis.create_consumer_group(config.stream_actions_in, "escalator");
    
    while (running) {
        try {
            auto messages = redis.read_messages(config.stream_actions_in, "escalator",
                                                "consumer1", 10, 1000);
            
            for (const auto& [msg_id, action_json] : messages) {
                nlohmann::json reply;
                try {
                    auto request = ActionRequest::from_json(action_json);
                    Alert updated = engine.apply_action(request);
                    reply = {{"ok", true}, {"alert", updated.to_json()}};
                } catch (const LifecycleError& e) {
                    reply = e.to_json();
                } catch (const std::exception& e) {
                    spdlog::error("Malformed action {}: {}", msg_id, e.what());
                    reply = {{"ok", false}, {"error", "bad_request"}, {"message", e.what()}};
                }
                
                reply["corr_id"] = action_json.value("corr_id", msg_id);
                reply["ts"] = util::current_iso8601();
                
                try {
                    redis.publish(config.stream_actions_out, reply);
                } catch (const std::exception& e) {
                    spdlog::error("Failed to publish action reply: {}", e.what());
                }
                redis.ack_message(config.stream_actions_in, "escalator", msg_id);
            }
            
        } catch (const std::exception& e) {
            spdlog::error("Action consumer error: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
    
    spdlog::info("Action consumer stopped");
}

int main() {
    try {
        // Load configuration
        auto config = Config::from_env();
        setup_logging(config.log_level);
        
        spdlog::info("==============================================");
        spdlog::info("Alert Escalation Engine v1.0");
        spdlog::info("==============================================");
        
        config.validate();
        
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);
        
        // Initialize components
        auto redis = std::make_shared<RedisBus>(config.redis_url);
        auto sink = std::make_shared<RedisEventSink>(redis, StreamRoutes{
            config.stream_notify,
            config.stream_overdue,
            config.stream_status,
            config.stream_audit
        });
        auto dispatcher = std::make_shared<EventDispatcher>(
            sink, static_cast<size_t>(config.event_buffer_size));
        auto clock = std::make_shared<SystemClock>();
        auto engine = std::make_shared<EscalationEngine>(config.engine_settings(), clock, dispatcher);
        
        if (!redis->ping()) {
            spdlog::error("Failed to connect to Redis");
            return 1;
        }
        
        HealthCheck health(redis, engine, dispatcher);
        QueryServer server(config, engine, health);
        
        dispatcher->start();
        server.start();
        
        std::atomic<bool> consumers_running{true};
        
        std::thread alert_thread(alert_consumer_loop,
                                 std::ref(*redis),
                                 std::ref(*engine),
                                 std::cref(config),
                                 std::ref(consumers_running));
        
        std::thread action_thread(action_consumer_loop,
                                  std::ref(*redis),
                                  std::ref(*engine),
                                  std::cref(config),
                                  std::ref(consumers_running));
        
        // Tick loop
        spdlog::info("Entering tick loop ({}ms)", config.tick_interval_ms);
        health.set_loop_status("running");
        
        auto interval = std::chrono::milliseconds(config.tick_interval_ms);
        auto next_tick = std::chrono::steady_clock::now();
        
        while (!shutdown_requested) {
            try {
                auto report = engine->tick();
                health.update_last_tick();
                
                if (report.overdue > 0 || report.escalated > 0) {
                    spdlog::info("Tick: {} open alerts, {} newly overdue, {} escalated",
                                 report.evaluated, report.overdue, report.escalated);
                }
            } catch (const std::exception& e) {
                spdlog::error("Error in tick loop: {}", e.what());
                health.set_loop_status("error");
            }
            
            next_tick += interval;
            auto now = std::chrono::steady_clock::now();
            if (next_tick < now) {
                next_tick = now;
            }
            
            // Sleep in short slices so shutdown stays responsive
            while (!shutdown_requested && std::chrono::steady_clock::now() < next_tick) {
                std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
                    next_tick - std::chrono::steady_clock::now(),
                    std::chrono::milliseconds(100)));
            }
            
            if (!shutdown_requested) {
                health.set_loop_status("running");
            }
        }
        
        // Graceful shutdown
        spdlog::info("Shutting down gracefully");
        health.set_loop_status("shutdown");
        
        consumers_running = false;
        if (alert_thread.joinable()) alert_thread.join();
        if (action_thread.joinable()) action_thread.join();
        
        server.stop();
        dispatcher->stop();
        
        spdlog::info("Shutdown complete");
        return 0;
        
    } catch (const ConfigError& e) {
        spdlog::error("Fatal error: invalid configuration: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
