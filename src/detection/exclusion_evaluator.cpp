#include "pv_watch/detection/exclusion_evaluator.h"
#include "pv_watch/utils/time_utils.h"

namespace pv_watch {
namespace detection {

ExclusionEvaluator::ExclusionEvaluator(int64_t weather_match_ms)
    : weather_match_ms_(weather_match_ms) {
}

std::optional<ExclusionMatch> ExclusionEvaluator::evaluate(
    const std::vector<ExclusionCondition>& conditions,
    const TelemetryRecord& record,
    const std::vector<WeatherSample>* weather,
    const std::vector<MaintenanceWindow>* maintenance) const {

    for (const auto& condition : conditions) {
        if (!condition.enabled) {
            continue;
        }
        if (matches(condition, record, weather, maintenance)) {
            return ExclusionMatch{condition.type, condition.condition};
        }
    }
    return std::nullopt;
}

bool ExclusionEvaluator::matches(const ExclusionCondition& condition,
                                 const TelemetryRecord& record,
                                 const std::vector<WeatherSample>* weather,
                                 const std::vector<MaintenanceWindow>* maintenance) const {
    if (condition.predicate) {
        return condition.predicate(record);
    }

    switch (condition.type) {
        case ExclusionType::WEATHER: {
            const auto& irradiance = record.environmental.irradiance;
            if (irradiance && *irradiance < condition.parameter("min_irradiance", 100.0)) {
                return true;
            }
            if (weather) {
                const WeatherSample* sample =
                    findClosestWeather(*weather, record.timestamp, weather_match_ms_);
                if (sample &&
                    sample->precipitation > condition.parameter("precipitation_threshold", 10.0)) {
                    return true;
                }
            }
            return false;
        }

        case ExclusionType::MAINTENANCE: {
            if (!maintenance) {
                return false;
            }
            auto buffer = static_cast<int64_t>(
                condition.parameter("buffer_hours", 2.0) * utils::MS_PER_HOUR);
            for (const auto& window : *maintenance) {
                if (record.timestamp >= window.start_ms - buffer &&
                    record.timestamp <= window.end_ms + buffer) {
                    return true;
                }
            }
            return false;
        }

        case ExclusionType::GRID:
            return record.production.voltage < condition.parameter("outage_voltage", 10.0);

        case ExclusionType::MANUAL: {
            auto start = static_cast<int64_t>(condition.parameter("start_ms", 0.0));
            auto end = static_cast<int64_t>(condition.parameter("end_ms", 0.0));
            return record.timestamp >= start && record.timestamp <= end;
        }

        default:
            return false;
    }
}

} // namespace detection
} // namespace pv_watch
