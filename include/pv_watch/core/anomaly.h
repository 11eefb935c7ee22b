#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pv_watch {

/**
 * @brief Closed set of anomaly types
 */
enum class AnomalyType {
    PRODUCTION_DROP,
    EFFICIENCY_LOSS,
    EQUIPMENT_MALFUNCTION,
    WEATHER_INCONSISTENCY,
    PERFORMANCE_DEGRADATION,
    COMMUNICATION_LOSS,
    POWER_QUALITY_ISSUE,
    SEASONAL_DEVIATION,
    PEER_COMPARISON_OUTLIER,
    PREDICTIVE_FAILURE,
    DATA_ANOMALY
};

enum class AnomalyCategory {
    PRODUCTION,
    PERFORMANCE,
    EQUIPMENT_FAULT,
    ENVIRONMENTAL,
    COMMUNICATION,
    DATA            // measurement / data-quality problems
};

/**
 * @brief Five-tier severity assigned by a detection method
 *
 * Collapsed to Severity when a candidate becomes an Anomaly:
 * CRITICAL -> critical, HIGH/MEDIUM -> warning, LOW/INFO -> info.
 */
enum class SeverityLevel {
    INFO = 0,
    LOW = 1,
    MEDIUM = 2,
    HIGH = 3,
    CRITICAL = 4
};

/**
 * @brief Alert severity of a stored anomaly
 */
enum class Severity {
    INFO = 0,
    WARNING = 1,
    CRITICAL = 2
};

enum class AnomalyStatus {
    ACTIVE,
    INVESTIGATING,   // acknowledged by an operator
    RESOLVED,
    FALSE_POSITIVE
};

enum class Urgency {
    IMMEDIATE,
    WITHIN_HOUR,
    WITHIN_DAY,
    PLANNED
};

enum class RecommendationPriority {
    IMMEDIATE,
    HIGH,
    MEDIUM,
    LOW
};

enum class RecommendationCategory {
    INSPECTION,
    MAINTENANCE,
    REPAIR,
    MONITORING
};

/**
 * @brief Baseline distribution captured at detection time
 */
struct HistoricalRange {
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double std_dev = 0.0;
};

/**
 * @brief Calendar position and seasonal expectation of the record
 */
struct SeasonalSnapshot {
    int hour_of_day = 0;
    int day_of_week = 0;
    int day_of_year = 1;
    std::optional<double> seasonal_expected;
    std::optional<double> seasonal_std_dev;
};

/**
 * @brief Weather conditions matched to the record
 */
struct WeatherSnapshot {
    double irradiance = 0.0;
    double temperature = 0.0;
    double cloud_cover = 0.0;
    double precipitation = 0.0;
    std::optional<double> expected_power;
};

/**
 * @brief Snapshot of what the detector saw
 */
struct AnomalyContext {
    std::string metric;
    double current_value = 0.0;
    double expected_value = 0.0;
    double deviation = 0.0;
    std::optional<double> z_score;
    std::optional<HistoricalRange> historical_range;
    SeasonalSnapshot seasonal;
    std::optional<WeatherSnapshot> weather;
};

struct AnomalyImpact {
    double production_loss = 0.0;       // kWh
    double efficiency_drop = 0.0;       // %
    double financial_impact = 0.0;      // $
    double environmental_impact = 0.0;  // kg CO2
    int duration_minutes = 60;
    Urgency urgency = Urgency::PLANNED;
};

struct Recommendation {
    std::string action;
    RecommendationPriority priority = RecommendationPriority::MEDIUM;
    RecommendationCategory category = RecommendationCategory::INSPECTION;
    double estimated_cost = 0.0;     // $
    int estimated_time_minutes = 0;
    std::string expected_benefit;
    std::vector<std::string> required_skills;
};

struct AnomalyFeedback {
    bool correct = false;
    std::string actual_cause;
    std::string action_taken;
    std::string outcome;
    std::string submitted_by;
    int64_t submitted_at = 0;
};

/**
 * @brief Output of a single detection method before consolidation
 */
struct AnomalyCandidate {
    AnomalyType type = AnomalyType::PRODUCTION_DROP;
    AnomalyCategory category = AnomalyCategory::PRODUCTION;
    SeverityLevel level = SeverityLevel::INFO;
    double score = 0.0;        // 0-1
    double confidence = 0.0;   // 0-1
    int64_t timestamp = 0;
    std::string description;
    std::vector<std::string> detected_by;
    AnomalyContext context;
};

/**
 * @brief Accepted anomaly
 *
 * Append-only once stored, except for status, acknowledgement and feedback.
 */
struct Anomaly {
    std::string id;
    std::string system_id;
    int64_t timestamp = 0;
    int64_t detected_at = 0;
    AnomalyType type = AnomalyType::PRODUCTION_DROP;
    AnomalyCategory category = AnomalyCategory::PRODUCTION;
    Severity severity = Severity::INFO;
    double score = 0.0;
    double confidence = 0.0;
    std::string description;
    std::vector<std::string> detected_by;
    AnomalyContext context;
    AnomalyImpact impact;
    std::vector<Recommendation> recommendations;

    AnomalyStatus status = AnomalyStatus::ACTIVE;
    bool acknowledged = false;
    std::string acknowledged_by;
    int64_t acknowledged_at = 0;
    int64_t closed_at = 0;
    std::optional<AnomalyFeedback> feedback;

    bool isTerminal() const {
        return status == AnomalyStatus::RESOLVED ||
               status == AnomalyStatus::FALSE_POSITIVE;
    }
};

/**
 * @brief Engine-level advice derived from a batch of anomalies
 */
struct SystemRecommendation {
    enum class Type {
        MODEL_TUNING,
        THRESHOLD_ADJUSTMENT,
        MAINTENANCE_SCHEDULING
    };

    Type type = Type::THRESHOLD_ADJUSTMENT;
    std::string description;
    RecommendationPriority priority = RecommendationPriority::MEDIUM;
    std::string impact;
};

// ========== Conversions ==========

Severity toSeverity(SeverityLevel level);

std::string anomalyTypeToString(AnomalyType type);
std::string anomalyCategoryToString(AnomalyCategory category);
std::string severityLevelToString(SeverityLevel level);
std::string severityToString(Severity severity);
std::string anomalyStatusToString(AnomalyStatus status);
std::string urgencyToString(Urgency urgency);
std::string recommendationPriorityToString(RecommendationPriority priority);
std::string recommendationCategoryToString(RecommendationCategory category);

/**
 * @throw std::invalid_argument on unknown names
 */
AnomalyType stringToAnomalyType(const std::string& str);
Severity stringToSeverity(const std::string& str);
AnomalyStatus stringToAnomalyStatus(const std::string& str);

} // namespace pv_watch
