#pragma once
#include "events.hpp"
#include <string>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

class RedisBus {
public:
    explicit RedisBus(const std::string& redis_url);
    
    void create_consumer_group(const std::string& stream, const std::string& group);
    std::vector<std::pair<std::string, nlohmann::json>>
        read_messages(const std::string& stream, const std::string& group,
                      const std::string& consumer, int count, int block_ms);
    void ack_message(const std::string& stream, const std::string& group,
                     const std::string& msg_id);
    
    // Throws on failure so callers can count delivery failures.
    void publish(const std::string& stream, const nlohmann::json& data);
    bool ping();
    
private:
    std::shared_ptr<sw::redis::Redis> redis_;
};

struct StreamRoutes {
    std::string notify;
    std::string overdue;
    std::string status;
    std::string audit;
};

// Delivers engine events to the Redis stream for their kind.
class RedisEventSink : public EventSink {
public:
    RedisEventSink(std::shared_ptr<RedisBus> bus, StreamRoutes routes);
    
    void publish(const Event& event) override;
    
private:
    std::shared_ptr<RedisBus> bus_;
    StreamRoutes routes_;
    
    const std::string& stream_for(EventKind kind) const;
};
