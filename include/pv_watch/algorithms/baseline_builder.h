#pragma once

#include "pv_watch/algorithms/statistics.h"
#include "pv_watch/core/telemetry_record.h"
#include "pv_watch/utils/config.h"
#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pv_watch {

/**
 * @brief Mean and spread of AC power for one hour of the day
 */
struct HourlyProfile {
    double mean = 0.0;
    double std_dev = 0.0;
    size_t samples = 0;
};

/**
 * @brief Rolling statistics for one system
 *
 * - statistics: performance-ratio distribution
 * - metric_statistics: distribution of every tracked metric
 * - hourly_profile: AC power by UTC hour; empty slots carry no seasonal signal
 */
struct Baseline {
    std::string system_id;
    stats::SummaryStatistics statistics;
    std::map<TrackedMetric, stats::SummaryStatistics> metric_statistics;
    std::array<std::optional<HourlyProfile>, 24> hourly_profile;
    size_t sample_count = 0;
    TimeRange window;
    int64_t built_at = 0;

    /**
     * @brief Statistics for a metric, or nullptr when not tracked
     */
    const stats::SummaryStatistics* metric(TrackedMetric m) const {
        auto it = metric_statistics.find(m);
        return it != metric_statistics.end() ? &it->second : nullptr;
    }

    const std::optional<HourlyProfile>& hour(int hour_of_day) const {
        return hourly_profile[static_cast<size_t>(hour_of_day % 24)];
    }
};

/**
 * @brief Builds baselines from a system's record history
 *
 * Configuration parameters:
 * - minimum_data_points: records required to build (default 100)
 * - historical_window_days: window covered and maximum baseline age (default 30)
 */
class BaselineBuilder {
public:
    explicit BaselineBuilder(const ConfigMap& config = {});

    /**
     * @brief Build a baseline
     * @param system_id System the records belong to
     * @param records History, any order
     * @param built_at Build time in ms
     * @throw InsufficientDataError when fewer than minimum_data_points records
     */
    Baseline build(const std::string& system_id,
                   const std::vector<TelemetryRecord>& records,
                   int64_t built_at) const;

    /**
     * @brief True when the baseline is older than the historical window
     */
    bool isStale(const Baseline& baseline, int64_t now) const;

    size_t minimumDataPoints() const { return minimum_data_points_; }

    int historicalWindowDays() const { return historical_window_days_; }

    int64_t historicalWindowMs() const;

private:
    size_t minimum_data_points_;
    int historical_window_days_;
};

} // namespace pv_watch
