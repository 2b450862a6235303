#include "dedup.hpp"
#include "security.hpp"
#include <iterator>

namespace networking {

DuplicateFilter::DuplicateFilter(std::size_t capacity, std::chrono::milliseconds window, const transfer::Clock& clock)
    : capacity_(capacity), window_(window), clock_(clock) {}

bool DuplicateFilter::is_duplicate(const std::string& origin, uint32_t packet_id, const std::string& content) {
    std::string key = security::fingerprint(origin, packet_id, content);
    auto now = clock_.now();

    std::lock_guard<std::mutex> lock(mutex_);
    evict_locked(now);

    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->last_seen = now;
        recency_.splice(recency_.end(), recency_, it->second);
        return true;
    }

    recency_.push_back(Entry{key, now});
    index_[key] = std::prev(recency_.end());
    evict_locked(now);
    return false;
}

bool DuplicateFilter::is_duplicate(const InboundMessage& message) {
    return is_duplicate(message.from, message.packet_id, message.text);
}

std::size_t DuplicateFilter::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recency_.size();
}

void DuplicateFilter::evict_locked(transfer::Clock::time_point now) {
    while (!recency_.empty() &&
           (recency_.size() > capacity_ || now - recency_.front().last_seen >= window_)) {
        index_.erase(recency_.front().fingerprint);
        recency_.pop_front();
    }
}

} // namespace networking
