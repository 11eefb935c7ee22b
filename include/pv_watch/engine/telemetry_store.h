#pragma once

#include "pv_watch/engine/data_providers.h"
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace pv_watch {
namespace engine {

/**
 * @brief In-memory telemetry history, per system
 *
 * Provides:
 * - Out-of-order ingestion, sorted lazily before queries
 * - Binary search by timestamp
 * - Thread-safe operations with read-write locks
 */
class TelemetryStore : public TelemetryHistoryProvider {
public:
    TelemetryStore() = default;
    ~TelemetryStore() override = default;

    /**
     * @brief Add a single record
     */
    void add(const TelemetryRecord& record);

    /**
     * @brief Add multiple records
     */
    void add_batch(const std::vector<TelemetryRecord>& records);

    std::vector<TelemetryRecord> fetchHistory(const std::string& system_id,
                                              const TimeRange& range) override;

    /**
     * @brief Number of records of a system
     */
    size_t size(const std::string& system_id) const;

    void clear();

private:
    struct Series {
        std::vector<TelemetryRecord> records;
        bool sorted = true;
    };

    mutable std::shared_mutex mutex_;
    std::map<std::string, Series> series_;
};

/**
 * @brief In-memory weather samples, per system
 */
class WeatherStore : public WeatherProvider {
public:
    void add(const std::string& system_id, const WeatherSample& sample);

    std::vector<WeatherSample> fetchWeather(const std::string& system_id,
                                            const TimeRange& range) override;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::vector<WeatherSample>> samples_;
};

/**
 * @brief In-memory maintenance calendar
 */
class MaintenanceSchedule : public MaintenanceScheduleProvider {
public:
    void schedule(const std::string& system_id, const detection::MaintenanceWindow& window);

    std::vector<detection::MaintenanceWindow> maintenanceWindows(
        const std::string& system_id) override;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::vector<detection::MaintenanceWindow>> windows_;
};

} // namespace engine
} // namespace pv_watch
