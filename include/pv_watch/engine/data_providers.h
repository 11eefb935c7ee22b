#pragma once

#include "pv_watch/core/anomaly.h"
#include "pv_watch/core/telemetry_record.h"
#include "pv_watch/detection/exclusion_evaluator.h"
#include <string>
#include <vector>

namespace pv_watch {
namespace engine {

/**
 * @brief Source of historical telemetry
 *
 * Implementations may block on I/O and should throw UpstreamFetchError when
 * the data cannot be retrieved. Must be safe to call from several threads.
 */
class TelemetryHistoryProvider {
public:
    virtual ~TelemetryHistoryProvider() = default;

    /**
     * @brief Records of a system within a time range, oldest first
     */
    virtual std::vector<TelemetryRecord> fetchHistory(const std::string& system_id,
                                                      const TimeRange& range) = 0;
};

/**
 * @brief Source of weather observations and forecasts
 */
class WeatherProvider {
public:
    virtual ~WeatherProvider() = default;

    virtual std::vector<WeatherSample> fetchWeather(const std::string& system_id,
                                                    const TimeRange& range) = 0;
};

/**
 * @brief Source of scheduled maintenance windows
 */
class MaintenanceScheduleProvider {
public:
    virtual ~MaintenanceScheduleProvider() = default;

    virtual std::vector<detection::MaintenanceWindow> maintenanceWindows(
        const std::string& system_id) = 0;
};

/**
 * @brief Receives engine events
 *
 * Called synchronously on the detecting thread after the system lock has
 * been released. Exceptions thrown by a listener are logged and ignored.
 */
class AnomalyListener {
public:
    virtual ~AnomalyListener() = default;

    virtual void onAnomaliesDetected(const std::string& system_id,
                                     const std::vector<Anomaly>& anomalies) = 0;

    virtual void onAnomalyAcknowledged(const Anomaly& /*anomaly*/) {}

    virtual void onAnomalyStatusChanged(const Anomaly& /*anomaly*/,
                                        AnomalyStatus /*previous*/) {}
};

} // namespace engine
} // namespace pv_watch
