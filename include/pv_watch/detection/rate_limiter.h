#pragma once

#include "pv_watch/core/anomaly.h"
#include "pv_watch/detection/detection_config.h"
#include <deque>
#include <map>

namespace pv_watch {
namespace detection {

/**
 * @brief Alert frequency control for one system
 *
 * Windows are measured on record timestamps, not wall-clock time, so replayed
 * data is limited the same way as live data. Not thread-safe: the owner
 * serialises access (the engine holds the system mutex).
 */
class RateLimiter {
public:
    explicit RateLimiter(const FrequencyLimits& limits = {});

    /**
     * @brief Check all limits for an anomaly and count it when allowed
     * @return false if the cooldown, hourly or daily cap rejects it
     */
    bool tryAcquire(AnomalyType type, int64_t timestamp);

    /**
     * @brief Check without counting
     */
    bool wouldAllow(AnomalyType type, int64_t timestamp) const;

    size_t countWithin(int64_t timestamp, int64_t window_ms) const;

    void setLimits(const FrequencyLimits& limits) { limits_ = limits; }

    const FrequencyLimits& limits() const { return limits_; }

    void reset();

private:
    void prune(int64_t timestamp);

    FrequencyLimits limits_;
    std::deque<int64_t> accepted_;                 // accepted timestamps, arrival order
    std::map<AnomalyType, int64_t> last_by_type_;  // last accepted per type
};

} // namespace detection
} // namespace pv_watch
