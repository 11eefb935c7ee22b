#include "pv_watch/detection/rate_limiter.h"
#include "pv_watch/utils/time_utils.h"
#include <algorithm>
#include <cstdlib>

namespace pv_watch {
namespace detection {

RateLimiter::RateLimiter(const FrequencyLimits& limits)
    : limits_(limits) {
}

bool RateLimiter::wouldAllow(AnomalyType type, int64_t timestamp) const {
    auto last = last_by_type_.find(type);
    if (last != last_by_type_.end()) {
        int64_t cooldown = static_cast<int64_t>(limits_.cooldown_minutes) * utils::MS_PER_MINUTE;
        if (std::llabs(timestamp - last->second) < cooldown) {
            return false;
        }
    }

    if (countWithin(timestamp, utils::MS_PER_HOUR) >= static_cast<size_t>(limits_.max_per_hour)) {
        return false;
    }
    if (countWithin(timestamp, utils::MS_PER_DAY) >= static_cast<size_t>(limits_.max_per_day)) {
        return false;
    }
    return true;
}

bool RateLimiter::tryAcquire(AnomalyType type, int64_t timestamp) {
    if (!wouldAllow(type, timestamp)) {
        return false;
    }
    accepted_.push_back(timestamp);
    last_by_type_[type] = timestamp;
    prune(timestamp);
    return true;
}

size_t RateLimiter::countWithin(int64_t timestamp, int64_t window_ms) const {
    return static_cast<size_t>(std::count_if(
        accepted_.begin(), accepted_.end(),
        [&](int64_t t) { return std::llabs(timestamp - t) < window_ms; }));
}

void RateLimiter::prune(int64_t timestamp) {
    int64_t newest = timestamp;
    for (int64_t t : accepted_) {
        newest = std::max(newest, t);
    }
    while (!accepted_.empty() && newest - accepted_.front() >= 2 * utils::MS_PER_DAY) {
        accepted_.pop_front();
    }
}

void RateLimiter::reset() {
    accepted_.clear();
    last_by_type_.clear();
}

} // namespace detection
} // namespace pv_watch
