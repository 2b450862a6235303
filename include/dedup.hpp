#pragma once

#include <string>
#include <cstdint>
#include <chrono>
#include <list>
#include <mutex>
#include <unordered_map>
#include "clock.hpp"
#include "transport.hpp"

namespace networking {

// Drops messages the mesh delivers more than once. Keyed by a fingerprint of
// (origin, packet id, content); entries live for `window` after they were last
// seen and at most `capacity` of them are kept, oldest evicted first.
class DuplicateFilter {
public:
    DuplicateFilter(std::size_t capacity, std::chrono::milliseconds window, const transfer::Clock& clock);

    // true if the message was already seen (and refreshes it); otherwise records it
    bool is_duplicate(const std::string& origin, uint32_t packet_id, const std::string& content);
    bool is_duplicate(const InboundMessage& message);

    std::size_t size() const;

private:
    struct Entry {
        std::string fingerprint;
        transfer::Clock::time_point last_seen;
    };

    void evict_locked(transfer::Clock::time_point now);

    const std::size_t capacity_;
    const std::chrono::milliseconds window_;
    const transfer::Clock& clock_;

    mutable std::mutex mutex_;
    std::list<Entry> recency_;   // front = least recently seen
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};

} // namespace networking
