#pragma once

#include <chrono>
#include "config.hpp"

namespace transfer {

class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
};

// Delay before resending attempt number `attempt` (1-based). The first attempt
// goes out immediately; after that the delay doubles from backoff_base and is
// capped at backoff_cap: 1s, 2s, 4s, 8s, 16s, 16s, ...
std::chrono::milliseconds backoff(int attempt, const config::Settings& settings);

} // namespace transfer
