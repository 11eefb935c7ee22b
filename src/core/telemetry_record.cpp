#include "pv_watch/core/telemetry_record.h"
#include "pv_watch/core/errors.h"
#include <cmath>
#include <cstdlib>

namespace pv_watch {

namespace {

void requireFinite(double value, const char* field) {
    if (!std::isfinite(value)) {
        throw InvalidInputError(std::string("Non-finite value in field ") + field);
    }
}

void requireFinite(const std::optional<double>& value, const char* field) {
    if (value) {
        requireFinite(*value, field);
    }
}

} // anonymous namespace

const std::vector<TrackedMetric>& allTrackedMetrics() {
    static const std::vector<TrackedMetric> metrics = {
        TrackedMetric::AC_POWER,
        TrackedMetric::PERFORMANCE_RATIO,
        TrackedMetric::EFFICIENCY
    };
    return metrics;
}

std::string trackedMetricToString(TrackedMetric metric) {
    switch (metric) {
        case TrackedMetric::AC_POWER: return "ac_power";
        case TrackedMetric::PERFORMANCE_RATIO: return "performance_ratio";
        case TrackedMetric::EFFICIENCY: return "efficiency";
        default: return "unknown";
    }
}

std::string trackedMetricLabel(TrackedMetric metric) {
    switch (metric) {
        case TrackedMetric::AC_POWER: return "AC Power";
        case TrackedMetric::PERFORMANCE_RATIO: return "Performance Ratio";
        case TrackedMetric::EFFICIENCY: return "System Efficiency";
        default: return "Unknown";
    }
}

double metricValue(const TelemetryRecord& record, TrackedMetric metric) {
    switch (metric) {
        case TrackedMetric::AC_POWER: return record.production.ac_power;
        case TrackedMetric::PERFORMANCE_RATIO: return record.performance.performance_ratio;
        case TrackedMetric::EFFICIENCY: return record.performance.efficiency;
        default: return 0.0;
    }
}

void validateRecord(const TelemetryRecord& record,
                    const std::string& expected_system_id) {
    if (record.system_id.empty()) {
        throw InvalidInputError("Record has an empty system id");
    }
    if (record.system_id != expected_system_id) {
        throw InvalidInputError("Record system id '" + record.system_id +
                                "' does not match '" + expected_system_id + "'");
    }

    requireFinite(record.production.dc_power, "production.dc_power");
    requireFinite(record.production.ac_power, "production.ac_power");
    requireFinite(record.production.energy_delta, "production.energy_delta");
    requireFinite(record.production.voltage, "production.voltage");
    requireFinite(record.production.current, "production.current");
    requireFinite(record.production.frequency, "production.frequency");
    requireFinite(record.environmental.irradiance, "environmental.irradiance");
    requireFinite(record.environmental.ambient_temp, "environmental.ambient_temp");
    requireFinite(record.environmental.module_temp, "environmental.module_temp");
    requireFinite(record.performance.performance_ratio, "performance.performance_ratio");
    requireFinite(record.performance.efficiency, "performance.efficiency");
    requireFinite(record.performance.specific_yield, "performance.specific_yield");
    requireFinite(record.performance.capacity_factor, "performance.capacity_factor");

    if (record.environmental.irradiance && *record.environmental.irradiance < 0.0) {
        throw InvalidInputError("Negative irradiance");
    }
    if (!std::isfinite(record.quality_confidence) ||
        record.quality_confidence < 0.0 || record.quality_confidence > 1.0) {
        throw InvalidInputError("Quality confidence outside [0,1]");
    }
}

const WeatherSample* findClosestWeather(const std::vector<WeatherSample>& weather,
                                        int64_t timestamp,
                                        int64_t max_distance_ms) {
    const WeatherSample* best = nullptr;
    int64_t best_distance = max_distance_ms;

    for (const auto& sample : weather) {
        int64_t distance = std::llabs(sample.timestamp - timestamp);
        if (distance <= best_distance) {
            if (!best || distance < best_distance) {
                best = &sample;
                best_distance = distance;
            }
        }
    }

    return best;
}

} // namespace pv_watch
