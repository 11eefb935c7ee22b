#include "pv_watch/algorithms/baseline_builder.h"
#include "pv_watch/core/errors.h"
#include "pv_watch/utils/time_utils.h"
#include <algorithm>
#include <limits>

namespace pv_watch {

BaselineBuilder::BaselineBuilder(const ConfigMap& config)
    : minimum_data_points_(utils::getConfigValue<size_t>(config, "minimum_data_points", 100)),
      historical_window_days_(utils::getConfigValue<int>(config, "historical_window_days", 30)) {
    if (minimum_data_points_ == 0) {
        minimum_data_points_ = 1;
    }
    if (historical_window_days_ <= 0) {
        historical_window_days_ = 30;
    }
}

Baseline BaselineBuilder::build(const std::string& system_id,
                                const std::vector<TelemetryRecord>& records,
                                int64_t built_at) const {
    if (records.size() < minimum_data_points_) {
        throw InsufficientDataError(
            "Baseline for system '" + system_id + "' needs " +
            std::to_string(minimum_data_points_) + " records, got " +
            std::to_string(records.size()),
            records.size(), minimum_data_points_);
    }

    Baseline baseline;
    baseline.system_id = system_id;
    baseline.sample_count = records.size();
    baseline.built_at = built_at;

    // Per-metric series
    std::map<TrackedMetric, std::vector<double>> series;
    std::array<std::vector<double>, 24> hourly_power;
    int64_t first = std::numeric_limits<int64_t>::max();
    int64_t last = std::numeric_limits<int64_t>::min();

    for (const auto& record : records) {
        for (TrackedMetric metric : allTrackedMetrics()) {
            series[metric].push_back(metricValue(record, metric));
        }
        hourly_power[utils::hourOfDay(record.timestamp)].push_back(
            record.production.ac_power);
        first = std::min(first, record.timestamp);
        last = std::max(last, record.timestamp);
    }

    for (const auto& [metric, values] : series) {
        baseline.metric_statistics[metric] = stats::summarize(values);
    }
    baseline.statistics = baseline.metric_statistics[TrackedMetric::PERFORMANCE_RATIO];
    baseline.window = TimeRange(first, last);

    // Hours without samples stay empty
    for (size_t hour = 0; hour < hourly_power.size(); ++hour) {
        const auto& values = hourly_power[hour];
        if (values.empty()) {
            continue;
        }
        HourlyProfile profile;
        profile.mean = stats::mean(values);
        profile.std_dev = stats::stdDev(values);
        profile.samples = values.size();
        baseline.hourly_profile[hour] = profile;
    }

    return baseline;
}

bool BaselineBuilder::isStale(const Baseline& baseline, int64_t now) const {
    return now - baseline.built_at > historicalWindowMs();
}

int64_t BaselineBuilder::historicalWindowMs() const {
    return static_cast<int64_t>(historical_window_days_) * utils::MS_PER_DAY;
}

} // namespace pv_watch
