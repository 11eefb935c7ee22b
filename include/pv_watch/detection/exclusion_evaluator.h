#pragma once

#include "pv_watch/detection/detection_config.h"
#include <optional>
#include <string>
#include <vector>

namespace pv_watch {
namespace detection {

/**
 * @brief Scheduled maintenance period of a system
 */
struct MaintenanceWindow {
    int64_t start_ms = 0;
    int64_t end_ms = 0;
    std::string description;
};

/**
 * @brief Exclusion condition that matched a record
 */
struct ExclusionMatch {
    ExclusionType type;
    std::string condition;
};

/**
 * @brief Decides whether a record is excluded from detection
 */
class ExclusionEvaluator {
public:
    explicit ExclusionEvaluator(int64_t weather_match_ms);

    /**
     * @brief First enabled condition, in configuration order, matching the record
     * @param conditions Conditions of the system configuration
     * @param record Record under analysis
     * @param weather Weather around the record, may be null
     * @param maintenance Scheduled windows, may be null
     * @return std::nullopt when no condition matches
     */
    std::optional<ExclusionMatch> evaluate(
        const std::vector<ExclusionCondition>& conditions,
        const TelemetryRecord& record,
        const std::vector<WeatherSample>* weather,
        const std::vector<MaintenanceWindow>* maintenance) const;

    /**
     * @brief Evaluate one condition, ignoring its enabled flag
     */
    bool matches(const ExclusionCondition& condition,
                 const TelemetryRecord& record,
                 const std::vector<WeatherSample>* weather,
                 const std::vector<MaintenanceWindow>* maintenance) const;

private:
    int64_t weather_match_ms_;
};

} // namespace detection
} // namespace pv_watch
