#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include "transport.hpp"

namespace networking {

// Bounded hand-off between a transport's receive thread and the protocol loop
class MessageQueue {
public:
    explicit MessageQueue(std::size_t capacity) : capacity_(capacity) {}

    // false (message dropped) when the queue is full or closed
    bool push(InboundMessage message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || queue_.size() >= capacity_) {
                return false;
            }
            queue_.push_back(std::move(message));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<InboundMessage> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); })) {
            return std::nullopt;
        }
        if (queue_.empty()) {
            return std::nullopt;
        }
        InboundMessage message = std::move(queue_.front());
        queue_.pop_front();
        return message;
    }

    // Wakes every waiter; later pushes are refused
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<InboundMessage> queue_;
    bool closed_ = false;
};

} // namespace networking
