#include "query_server.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

QueryServer::QueryServer(const Config& config,
                         std::shared_ptr<EscalationEngine> engine,
                         HealthCheck& health)
    : config_(config)
    , engine_(std::move(engine))
    , health_(health)
    , server_(std::make_unique<httplib::Server>())
{}

void QueryServer::start() {
    if (running_) return;
    
    setup_routes();
    running_ = true;
    
    server_thread_ = std::thread([this]() {
        spdlog::info("HTTP server listening on {}:{}",
                     config_.listen_addr, config_.listen_port);
        if (!server_->listen(config_.listen_addr.c_str(), config_.listen_port)) {
            spdlog::error("HTTP server failed to bind {}:{}",
                          config_.listen_addr, config_.listen_port);
        }
    });
}

void QueryServer::stop() {
    if (!running_) return;
    
    running_ = false;
    server_->stop();
    
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    
    spdlog::info("HTTP server stopped");
}

void QueryServer::setup_routes() {
    server_->Get("/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    
    // Fixed paths must be registered before the /alerts/{id} pattern
    server_->Get("/alerts/visible", [this](const httplib::Request& req, httplib::Response& res) {
        handle_visible(req, res);
    });
    server_->Get("/alerts/queued", [this](const httplib::Request& req, httplib::Response& res) {
        handle_queued(req, res);
    });
    server_->Get("/alerts/overdue", [this](const httplib::Request& req, httplib::Response& res) {
        handle_overdue(req, res);
    });
    server_->Get("/alerts", [this](const httplib::Request& req, httplib::Response& res) {
        handle_list(req, res);
    });
    server_->Post("/alerts", [this](const httplib::Request& req, httplib::Response& res) {
        handle_create(req, res);
    });
    server_->Get(R"(/alerts/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handle_get(req, res);
    });
    server_->Post(R"(/alerts/([^/]+)/actions)", [this](const httplib::Request& req, httplib::Response& res) {
        handle_action(req, res);
    });
}

void QueryServer::send_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

nlohmann::json QueryServer::views_to_json(const std::vector<AlertView>& views) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& view : views) {
        arr.push_back(view.to_json());
    }
    return arr;
}

size_t QueryServer::max_visible_param(const httplib::Request& req) const {
    if (req.has_param("max")) {
        try {
            int value = std::stoi(req.get_param_value("max"));
            if (value >= 0) return static_cast<size_t>(value);
        } catch (const std::exception&) {
            spdlog::debug("Ignoring invalid max parameter");
        }
    }
    return engine_->settings().max_visible;
}

AlertFilter QueryServer::filter_from_params(const httplib::Request& req) {
    AlertFilter filter;
    
    if (req.has_param("priority")) {
        for (const auto& p : util::split(req.get_param_value("priority"), ',')) {
            filter.priorities.push_back(parse_priority(p));
        }
    }
    if (req.has_param("status")) {
        for (const auto& s : util::split(req.get_param_value("status"), ',')) {
            filter.statuses.push_back(parse_status(s));
        }
    }
    if (req.has_param("department")) {
        for (const auto& d : util::split(req.get_param_value("department"), ',')) {
            filter.departments.push_back(util::trim(d));
        }
    }
    if (req.has_param("q")) {
        filter.search_term = req.get_param_value("q");
    }
    if (req.has_param("assigned_to")) {
        filter.assigned_to = req.get_param_value("assigned_to");
    }
    if (req.has_param("from")) {
        filter.created_after = util::from_iso8601(req.get_param_value("from"));
    }
    if (req.has_param("to")) {
        filter.created_before = util::from_iso8601(req.get_param_value("to"));
    }
    
    return filter;
}

nlohmann::json QueryServer::actions_for(const AlertView& view) const {
    return to_json(AlertLifecycle::available_actions(view.alert, view.timer.is_overdue(),
                                                     engine_->settings().tiers));
}

void QueryServer::handle_health(const httplib::Request&, httplib::Response& res) {
    auto status = health_.get_status();
    send_json(res, status["ok"].get<bool>() ? 200 : 503, status);
}

void QueryServer::handle_visible(const httplib::Request& req, httplib::Response& res) {
    size_t max_visible = max_visible_param(req);
    send_json(res, 200, views_to_json(engine_->get_visible(max_visible, engine_->now())));
}

void QueryServer::handle_queued(const httplib::Request& req, httplib::Response& res) {
    size_t max_visible = max_visible_param(req);
    send_json(res, 200, views_to_json(engine_->get_queued(max_visible, engine_->now())));
}

void QueryServer::handle_overdue(const httplib::Request&, httplib::Response& res) {
    send_json(res, 200, views_to_json(engine_->overdue_worklist(engine_->now())));
}

void QueryServer::handle_list(const httplib::Request& req, httplib::Response& res) {
    try {
        auto filter = filter_from_params(req);
        send_json(res, 200, views_to_json(engine_->query(filter, engine_->now())));
    } catch (const std::invalid_argument& e) {
        send_json(res, 400, {{"ok", false}, {"error", "bad_request"}, {"message", e.what()}});
    }
}

void QueryServer::handle_get(const httplib::Request& req, httplib::Response& res) {
    std::string alert_id = req.matches[1];
    auto view = engine_->get_alert(alert_id, engine_->now());
    if (!view) {
        send_json(res, 404, LifecycleError::unknown_alert(alert_id).to_json());
        return;
    }
    
    nlohmann::json body = view->to_json();
    body["available_actions"] = actions_for(*view);
    send_json(res, 200, body);
}

void QueryServer::handle_create(const httplib::Request& req, httplib::Response& res) {
    try {
        auto body = nlohmann::json::parse(req.body);
        
        AlertMetadata metadata;
        metadata.alert_type = body.value("alert_type", "");
        metadata.department = body.value("department", "");
        metadata.room_number = body.value("room_number", "");
        metadata.description = body.value("description", "");
        metadata.created_by = body.value("created_by", "");
        
        Alert alert = engine_->create_alert(parse_priority(body.at("priority").get<std::string>()),
                                            metadata);
        send_json(res, 201, alert.to_json());
    } catch (const nlohmann::json::exception& e) {
        send_json(res, 400, {{"ok", false}, {"error", "bad_request"}, {"message", e.what()}});
    } catch (const std::invalid_argument& e) {
        send_json(res, 400, {{"ok", false}, {"error", "bad_request"}, {"message", e.what()}});
    }
}

void QueryServer::handle_action(const httplib::Request& req, httplib::Response& res) {
    try {
        auto body = nlohmann::json::parse(req.body);
        body["alert_id"] = std::string(req.matches[1]);
        
        auto request = ActionRequest::from_json(body);
        Alert updated = engine_->apply_action(request);
        
        // Resolved alerts may already be archived out of the working set
        nlohmann::json actions = nlohmann::json::array();
        if (auto view = engine_->get_alert(updated.id, engine_->now())) {
            actions = actions_for(*view);
        }
        
        send_json(res, 200, {
            {"ok", true},
            {"alert", updated.to_json()},
            {"available_actions", actions}
        });
    } catch (const LifecycleError& e) {
        int status = e.kind() == LifecycleErrorKind::UnknownAlert ? 404 : 409;
        send_json(res, status, e.to_json());
    } catch (const nlohmann::json::exception& e) {
        send_json(res, 400, {{"ok", false}, {"error", "bad_request"}, {"message", e.what()}});
    } catch (const std::invalid_argument& e) {
        send_json(res, 400, {{"ok", false}, {"error", "bad_request"}, {"message", e.what()}});
    }
}
