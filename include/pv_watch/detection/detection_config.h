#pragma once

#include "pv_watch/core/anomaly.h"
#include "pv_watch/core/system_profile.h"
#include "pv_watch/core/telemetry_record.h"
#include "pv_watch/utils/config.h"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace pv_watch {
namespace detection {

enum class Sensitivity {
    LOW,
    MEDIUM,
    HIGH
};

std::string sensitivityToString(Sensitivity sensitivity);

/**
 * @throw std::invalid_argument on unknown names
 */
Sensitivity stringToSensitivity(const std::string& str);

enum class ExclusionType {
    WEATHER,
    MAINTENANCE,
    GRID,
    MANUAL
};

std::string exclusionTypeToString(ExclusionType type);
ExclusionType stringToExclusionType(const std::string& str);

/**
 * @brief Condition under which a record is not analysed at all
 *
 * Built-in parameters by type:
 * - weather: min_irradiance (100 W/m²), precipitation_threshold (10 mm)
 * - maintenance: buffer_hours (2)
 * - grid: outage_voltage (10 V)
 * - manual: start_ms, end_ms
 *
 * A predicate, when set, replaces the built-in check for the type.
 */
struct ExclusionCondition {
    using Predicate = std::function<bool(const TelemetryRecord&)>;

    ExclusionType type = ExclusionType::WEATHER;
    bool enabled = true;
    std::string condition;
    std::map<std::string, double> parameters;
    Predicate predicate;

    double parameter(const std::string& key, double default_value) const {
        auto it = parameters.find(key);
        return it != parameters.end() ? it->second : default_value;
    }

    static ExclusionCondition weather(double precipitation_threshold = 10.0,
                                      double min_irradiance = 100.0);
    static ExclusionCondition maintenance(double buffer_hours = 2.0);
    static ExclusionCondition grid(double outage_voltage = 10.0);
    static ExclusionCondition manual(int64_t start_ms, int64_t end_ms);
};

/**
 * @brief Minimum score an anomaly needs at its severity
 */
struct SeverityThresholds {
    double info = 0.3;
    double warning = 0.6;
    double critical = 0.8;

    double forSeverity(Severity severity) const;
};

struct FrequencyLimits {
    int max_per_hour = 5;
    int max_per_day = 20;
    int cooldown_minutes = 15;
};

/**
 * @brief An anomaly is dropped only when it is below all three minimums
 */
struct ImpactMinimums {
    double min_production_loss = 1.0;   // kWh
    double min_efficiency_drop = 2.0;   // %
    double min_financial_impact = 0.5;  // $
};

/**
 * @brief Per-system detection settings
 */
struct DetectionConfig {
    std::string system_id;
    bool enabled = true;
    Sensitivity sensitivity = Sensitivity::MEDIUM;
    std::vector<std::string> methods;
    SeverityThresholds severity_thresholds;
    FrequencyLimits frequency;
    ImpactMinimums impact;
    std::vector<ExclusionCondition> exclusions;
    int historical_window_days = 30;
    size_t minimum_data_points = 100;
    SystemProfile system;

    // Tuning parameters keyed by method name
    std::map<std::string, ConfigMap> method_params;

    /**
     * @brief Default configuration: every built-in statistical and rule based
     *        method, weather and maintenance exclusions
     */
    static DetectionConfig defaults(const std::string& system_id);

    /**
     * @brief Build a configuration from flat key=value entries
     *
     * Recognised keys (all optional except system_id):
     *   system_id, enabled, sensitivity, methods (comma list),
     *   severity.info|warning|critical,
     *   frequency.max_per_hour|max_per_day|cooldown_minutes,
     *   impact.min_production_loss|min_efficiency_drop|min_financial_impact,
     *   historical_window_days, minimum_data_points,
     *   system.capacity_kw|electricity_rate|co2_factor|max_module_efficiency|
     *          system_age_years|annual_target_kwh,
     *   exclusions (comma list of types),
     *   exclusion.<type>.enabled, exclusion.<type>.<parameter>,
     *   method.<name>.<parameter>
     *
     * @throw InvalidInputError if the result fails validate()
     */
    static DetectionConfig fromConfigMap(const ConfigMap& config);

    /**
     * @brief Check invariants
     * @throw InvalidInputError on empty system id, thresholds that are not
     *        strictly increasing within [0,1], negative caps or empty window
     */
    void validate() const;

    /**
     * @brief Parameters for one method, with the system sensitivity filled in
     */
    ConfigMap methodConfig(const std::string& method) const;

    bool methodEnabled(const std::string& method) const;
};

} // namespace detection
} // namespace pv_watch
