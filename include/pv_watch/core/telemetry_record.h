#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pv_watch {

/**
 * @brief Electrical production measurements
 */
struct ProductionMetrics {
    double dc_power = 0.0;       // kW
    double ac_power = 0.0;       // kW
    double energy_delta = 0.0;   // kWh since previous record
    double voltage = 0.0;        // V
    double current = 0.0;        // A
    double frequency = 0.0;      // Hz
};

/**
 * @brief On-site environmental sensors (all optional)
 */
struct EnvironmentalConditions {
    std::optional<double> irradiance;    // W/m²
    std::optional<double> ambient_temp;  // °C
    std::optional<double> module_temp;   // °C
};

/**
 * @brief Derived performance indicators
 */
struct PerformanceMetrics {
    double performance_ratio = 0.0;  // actual / theoretical yield
    double efficiency = 0.0;         // %
    double specific_yield = 0.0;     // kWh/kWp
    double capacity_factor = 0.0;    // 0-1
};

/**
 * @brief One time-stamped telemetry measurement of a PV system
 *
 * - timestamp: milliseconds since Unix epoch (UTC)
 * - quality_confidence: data quality reported by ingestion, in [0,1]
 *
 * Records are immutable once ingested.
 */
struct TelemetryRecord {
    std::string system_id;
    int64_t timestamp = 0;
    ProductionMetrics production;
    EnvironmentalConditions environmental;
    PerformanceMetrics performance;
    double quality_confidence = 1.0;

    TelemetryRecord() = default;

    TelemetryRecord(const std::string& id, int64_t ts)
        : system_id(id), timestamp(ts) {}
};

/**
 * @brief Weather observation or forecast sample
 */
struct WeatherSample {
    int64_t timestamp = 0;
    double ghi = 0.0;            // global horizontal irradiance, W/m²
    double temperature = 25.0;   // °C
    double cloud_cover = 0.0;    // 0-1
    double precipitation = 0.0;  // mm
    double wind_speed = 0.0;     // m/s
    double humidity = 50.0;      // %

    WeatherSample() = default;

    WeatherSample(int64_t ts, double irradiance)
        : timestamp(ts), ghi(irradiance) {}
};

/**
 * @brief Time range for queries and windows
 */
struct TimeRange {
    int64_t start_time;  // inclusive
    int64_t end_time;    // inclusive

    TimeRange() : start_time(0), end_time(0) {}

    TimeRange(int64_t start, int64_t end)
        : start_time(start), end_time(end) {}

    bool contains(int64_t timestamp) const {
        return timestamp >= start_time && timestamp <= end_time;
    }

    int64_t duration() const {
        return end_time - start_time;
    }
};

/**
 * @brief Metrics tracked by baselines and statistical detection
 */
enum class TrackedMetric {
    AC_POWER,
    PERFORMANCE_RATIO,
    EFFICIENCY
};

const std::vector<TrackedMetric>& allTrackedMetrics();

std::string trackedMetricToString(TrackedMetric metric);

/**
 * @brief Human-readable metric label
 */
std::string trackedMetricLabel(TrackedMetric metric);

double metricValue(const TelemetryRecord& record, TrackedMetric metric);

/**
 * @brief Check a record before it enters detection
 * @param record Record to check
 * @param expected_system_id System the record is being ingested for
 * @throw InvalidInputError on empty or mismatched system id, non-finite
 *        values, negative irradiance or quality outside [0,1]
 */
void validateRecord(const TelemetryRecord& record,
                    const std::string& expected_system_id);

/**
 * @brief Weather sample closest to timestamp within max_distance_ms
 * @return nullptr when no sample is close enough
 */
const WeatherSample* findClosestWeather(const std::vector<WeatherSample>& weather,
                                        int64_t timestamp,
                                        int64_t max_distance_ms);

} // namespace pv_watch
