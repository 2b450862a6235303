#include "clock.hpp"
#include <algorithm>

namespace transfer {

std::chrono::milliseconds backoff(int attempt, const config::Settings& settings) {
    if (attempt <= 1) {
        return std::chrono::milliseconds(0);
    }
    std::chrono::milliseconds delay = settings.backoff_base;
    for (int i = 2; i < attempt && delay < settings.backoff_cap; ++i) {
        delay *= 2;
    }
    return std::min(delay, settings.backoff_cap);
}

} // namespace transfer
