#pragma once

#include "config.hpp"
#include "escalation_engine.hpp"
#include "health.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <thread>

// HTTP surface for UI polling and operator actions.
class QueryServer {
public:
    QueryServer(const Config& config,
                std::shared_ptr<EscalationEngine> engine,
                HealthCheck& health);
    
    void start();
    void stop();
    
private:
    const Config& config_;
    std::shared_ptr<EscalationEngine> engine_;
    HealthCheck& health_;
    
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;
    
    void setup_routes();
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_visible(const httplib::Request& req, httplib::Response& res);
    void handle_queued(const httplib::Request& req, httplib::Response& res);
    void handle_overdue(const httplib::Request& req, httplib::Response& res);
    void handle_list(const httplib::Request& req, httplib::Response& res);
    void handle_get(const httplib::Request& req, httplib::Response& res);
    void handle_create(const httplib::Request& req, httplib::Response& res);
    void handle_action(const httplib::Request& req, httplib::Response& res);
    
    size_t max_visible_param(const httplib::Request& req) const;
    static AlertFilter filter_from_params(const httplib::Request& req);
    nlohmann::json actions_for(const AlertView& view) const;
    static nlohmann::json views_to_json(const std::vector<AlertView>& views);
    static void send_json(httplib::Response& res, int status, const nlohmann::json& body);
};
