#include "redis_bus.hpp"
#include <spdlog/spdlog.h>

RedisBus::RedisBus(const std::string& redis_url) {
    redis_ = std::make_shared<sw::redis::Redis>(redis_url);
    spdlog::info("Connected to Redis");
}

void RedisBus::create_consumer_group(const std::string& stream, const std::string& group) {
    try {
        redis_->xgroup_create(stream, group, "$", true);
    } catch (const sw::redis::ReplyError&) {
        // BUSYGROUP: group already exists
    }
}

std::vector<std::pair<std::string, nlohmann::json>>
RedisBus::read_messages(const std::string& stream, const std::string& group,
                        const std::string& consumer, int count, int block_ms) {
    std::vector<std::pair<std::string, nlohmann::json>> results;
    try {
        using Attrs = std::vector<std::pair<std::string, std::string>>;
        using Item = std::pair<std::string, sw::redis::Optional<Attrs>>;
        using ItemStream = std::vector<Item>;
        std::unordered_map<std::string, ItemStream> items;
        
        redis_->xreadgroup(group, consumer, stream, ">", std::chrono::milliseconds(block_ms),
                           count, std::inserter(items, items.end()));
        
        for (const auto& [_, item_stream] : items) {
            for (const auto& item : item_stream) {
                if (!item.second) continue;
                for (const auto& [field, value] : *item.second) {
                    if (field != "data") continue;
                    try {
                        results.emplace_back(item.first, nlohmann::json::parse(value));
                    } catch (const nlohmann::json::parse_error& e) {
                        spdlog::error("Malformed message {} on {}: {}", item.first, stream, e.what());
                        ack_message(stream, group, item.first);
                    }
                }
            }
        }
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to read from {}: {}", stream, e.what());
    }
    return results;
}

void RedisBus::ack_message(const std::string& stream, const std::string& group,
                           const std::string& msg_id) {
    try {
        redis_->xack(stream, group, msg_id);
    } catch (const sw::redis::Error& e) {
        spdlog::error("Failed to ack: {}", e.what());
    }
}

void RedisBus::publish(const std::string& stream, const nlohmann::json& data) {
    std::unordered_map<std::string, std::string> fields;
    fields["data"] = data.dump();
    redis_->xadd(stream, "*", fields.begin(), fields.end());
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const sw::redis::Error&) {
        return false;
    }
}

RedisEventSink::RedisEventSink(std::shared_ptr<RedisBus> bus, StreamRoutes routes)
    : bus_(std::move(bus)), routes_(std::move(routes)) {}

const std::string& RedisEventSink::stream_for(EventKind kind) const {
    switch (kind) {
        case EventKind::Notify: return routes_.notify;
        case EventKind::Overdue: return routes_.overdue;
        case EventKind::StatusChanged:
        case EventKind::Assignment: return routes_.status;
        case EventKind::Audit: return routes_.audit;
    }
    return routes_.status;
}

void RedisEventSink::publish(const Event& event) {
    bus_->publish(stream_for(event.kind), event.payload);
}
