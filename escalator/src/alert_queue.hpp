#pragma once

#include "types.hpp"
#include <vector>
#include <string>
#include <optional>
#include <shared_mutex>
#include <cstdint>

// Alerts ordered by (status weight, priority weight, created_at), ties in
// insertion order. Entries are never mutated in place; updates remove and
// re-insert.
class AlertQueue {
public:
    void add(const Alert& alert);
    bool remove(const std::string& id);
    
    // Replaces the stored alert with the same id and re-sorts it.
    // Returns false when the id is not queued.
    bool update(const Alert& alert);
    bool reprioritize(const std::string& id, AlertStatus new_status);
    
    std::vector<Alert> visible(size_t max_visible) const;
    std::vector<Alert> queued(size_t max_visible) const;
    std::vector<Alert> all() const;
    
    std::optional<Alert> get(const std::string& id) const;
    bool contains(const std::string& id) const;
    size_t size() const;
    
private:
    struct Entry {
        Alert alert;
        uint64_t seq;
    };
    
    mutable std::shared_mutex mutex_;
    std::vector<Entry> entries_;
    uint64_t next_seq_ = 0;
    
    static bool ordered_before(const Entry& a, const Entry& b);
    void insert_sorted(Entry entry);
    std::vector<Entry>::iterator find_locked(const std::string& id);
    std::vector<Entry>::const_iterator find_locked(const std::string& id) const;
};
