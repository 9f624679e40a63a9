#include "alert_queue.hpp"
#include "priority.hpp"
#include <algorithm>
#include <mutex>
#include <tuple>

bool AlertQueue::ordered_before(const Entry& a, const Entry& b) {
    return std::make_tuple(status_weight(a.alert.status), priority_weight(a.alert.priority),
                           a.alert.created_at, a.seq) <
           std::make_tuple(status_weight(b.alert.status), priority_weight(b.alert.priority),
                           b.alert.created_at, b.seq);
}

void AlertQueue::insert_sorted(Entry entry) {
    auto pos = std::upper_bound(entries_.begin(), entries_.end(), entry, ordered_before);
    entries_.insert(pos, std::move(entry));
}

std::vector<AlertQueue::Entry>::iterator AlertQueue::find_locked(const std::string& id) {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&id](const Entry& e) { return e.alert.id == id; });
}

std::vector<AlertQueue::Entry>::const_iterator AlertQueue::find_locked(const std::string& id) const {
    return std::find_if(entries_.begin(), entries_.end(),
                        [&id](const Entry& e) { return e.alert.id == id; });
}

void AlertQueue::add(const Alert& alert) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    
    // Re-adding a known id replaces it rather than duplicating it
    auto it = find_locked(alert.id);
    if (it != entries_.end()) {
        uint64_t seq = it->seq;
        entries_.erase(it);
        insert_sorted(Entry{alert, seq});
        return;
    }
    
    insert_sorted(Entry{alert, next_seq_++});
}

bool AlertQueue::remove(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = find_locked(id);
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

bool AlertQueue::update(const Alert& alert) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = find_locked(alert.id);
    if (it == entries_.end()) return false;
    
    uint64_t seq = it->seq;
    entries_.erase(it);
    insert_sorted(Entry{alert, seq});
    return true;
}

bool AlertQueue::reprioritize(const std::string& id, AlertStatus new_status) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = find_locked(id);
    if (it == entries_.end()) return false;
    
    Entry entry = *it;
    entries_.erase(it);
    entry.alert.status = new_status;
    insert_sorted(std::move(entry));
    return true;
}

std::vector<Alert> AlertQueue::visible(size_t max_visible) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Alert> result;
    size_t n = std::min(max_visible, entries_.size());
    result.reserve(n);
    for (size_t i = 0; i < n; i++) {
        result.push_back(entries_[i].alert);
    }
    return result;
}

std::vector<Alert> AlertQueue::queued(size_t max_visible) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Alert> result;
    for (size_t i = max_visible; i < entries_.size(); i++) {
        result.push_back(entries_[i].alert);
    }
    return result;
}

std::vector<Alert> AlertQueue::all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Alert> result;
    result.reserve(entries_.size());
    for (const auto& e : entries_) {
        result.push_back(e.alert);
    }
    return result;
}

std::optional<Alert> AlertQueue::get(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = find_locked(id);
    if (it == entries_.end()) return std::nullopt;
    return it->alert;
}

bool AlertQueue::contains(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return find_locked(id) != entries_.end();
}

size_t AlertQueue::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}
