#include "pv_watch/engine/telemetry_store.h"
#include <algorithm>
#include <mutex>

namespace pv_watch {
namespace engine {

void TelemetryStore::add(const TelemetryRecord& record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    Series& series = series_[record.system_id];
    // Check if data is out of order
    if (!series.records.empty() && record.timestamp < series.records.back().timestamp) {
        series.sorted = false;
    }
    series.records.push_back(record);
}

void TelemetryStore::add_batch(const std::vector<TelemetryRecord>& records) {
    for (const auto& record : records) {
        add(record);
    }
}

std::vector<TelemetryRecord> TelemetryStore::fetchHistory(const std::string& system_id,
                                                          const TimeRange& range) {
    // Sorting mutates, so queries take the exclusive lock when needed
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = series_.find(system_id);
    if (it == series_.end()) {
        return {};
    }

    Series& series = it->second;
    if (!series.sorted) {
        std::stable_sort(series.records.begin(), series.records.end(),
                         [](const TelemetryRecord& a, const TelemetryRecord& b) {
                             return a.timestamp < b.timestamp;
                         });
        series.sorted = true;
    }

    auto first = std::lower_bound(
        series.records.begin(), series.records.end(), range.start_time,
        [](const TelemetryRecord& r, int64_t ts) { return r.timestamp < ts; });
    auto last = std::upper_bound(
        series.records.begin(), series.records.end(), range.end_time,
        [](int64_t ts, const TelemetryRecord& r) { return ts < r.timestamp; });

    if (first >= last) {
        return {};
    }
    return std::vector<TelemetryRecord>(first, last);
}

size_t TelemetryStore::size(const std::string& system_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = series_.find(system_id);
    return it != series_.end() ? it->second.records.size() : 0;
}

void TelemetryStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    series_.clear();
}

// ========== WeatherStore ==========

void WeatherStore::add(const std::string& system_id, const WeatherSample& sample) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    samples_[system_id].push_back(sample);
}

std::vector<WeatherSample> WeatherStore::fetchWeather(const std::string& system_id,
                                                      const TimeRange& range) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<WeatherSample> result;
    auto it = samples_.find(system_id);
    if (it == samples_.end()) {
        return result;
    }
    for (const auto& sample : it->second) {
        if (range.contains(sample.timestamp)) {
            result.push_back(sample);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const WeatherSample& a, const WeatherSample& b) {
                  return a.timestamp < b.timestamp;
              });
    return result;
}

// ========== MaintenanceSchedule ==========

void MaintenanceSchedule::schedule(const std::string& system_id,
                                   const detection::MaintenanceWindow& window) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    windows_[system_id].push_back(window);
}

std::vector<detection::MaintenanceWindow> MaintenanceSchedule::maintenanceWindows(
    const std::string& system_id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = windows_.find(system_id);
    return it != windows_.end() ? it->second : std::vector<detection::MaintenanceWindow>{};
}

} // namespace engine
} // namespace pv_watch
