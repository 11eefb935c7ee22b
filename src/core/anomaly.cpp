#include "pv_watch/core/anomaly.h"
#include <cctype>
#include <stdexcept>

namespace pv_watch {

namespace {

std::string toLower(const std::string& str) {
    std::string lower = str;
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

} // anonymous namespace

Severity toSeverity(SeverityLevel level) {
    switch (level) {
        case SeverityLevel::CRITICAL: return Severity::CRITICAL;
        case SeverityLevel::HIGH:
        case SeverityLevel::MEDIUM: return Severity::WARNING;
        case SeverityLevel::LOW:
        case SeverityLevel::INFO:
        default: return Severity::INFO;
    }
}

std::string anomalyTypeToString(AnomalyType type) {
    switch (type) {
        case AnomalyType::PRODUCTION_DROP: return "production_drop";
        case AnomalyType::EFFICIENCY_LOSS: return "efficiency_loss";
        case AnomalyType::EQUIPMENT_MALFUNCTION: return "equipment_malfunction";
        case AnomalyType::WEATHER_INCONSISTENCY: return "weather_inconsistency";
        case AnomalyType::PERFORMANCE_DEGRADATION: return "performance_degradation";
        case AnomalyType::COMMUNICATION_LOSS: return "communication_loss";
        case AnomalyType::POWER_QUALITY_ISSUE: return "power_quality_issue";
        case AnomalyType::SEASONAL_DEVIATION: return "seasonal_deviation";
        case AnomalyType::PEER_COMPARISON_OUTLIER: return "peer_comparison_outlier";
        case AnomalyType::PREDICTIVE_FAILURE: return "predictive_failure";
        case AnomalyType::DATA_ANOMALY: return "data_anomaly";
        default: return "unknown";
    }
}

std::string anomalyCategoryToString(AnomalyCategory category) {
    switch (category) {
        case AnomalyCategory::PRODUCTION: return "production";
        case AnomalyCategory::PERFORMANCE: return "performance";
        case AnomalyCategory::EQUIPMENT_FAULT: return "equipment_fault";
        case AnomalyCategory::ENVIRONMENTAL: return "environmental";
        case AnomalyCategory::COMMUNICATION: return "communication";
        case AnomalyCategory::DATA: return "data";
        default: return "unknown";
    }
}

std::string severityLevelToString(SeverityLevel level) {
    switch (level) {
        case SeverityLevel::INFO: return "info";
        case SeverityLevel::LOW: return "low";
        case SeverityLevel::MEDIUM: return "medium";
        case SeverityLevel::HIGH: return "high";
        case SeverityLevel::CRITICAL: return "critical";
        default: return "unknown";
    }
}

std::string severityToString(Severity severity) {
    switch (severity) {
        case Severity::INFO: return "info";
        case Severity::WARNING: return "warning";
        case Severity::CRITICAL: return "critical";
        default: return "unknown";
    }
}

std::string anomalyStatusToString(AnomalyStatus status) {
    switch (status) {
        case AnomalyStatus::ACTIVE: return "active";
        case AnomalyStatus::INVESTIGATING: return "investigating";
        case AnomalyStatus::RESOLVED: return "resolved";
        case AnomalyStatus::FALSE_POSITIVE: return "false_positive";
        default: return "unknown";
    }
}

std::string urgencyToString(Urgency urgency) {
    switch (urgency) {
        case Urgency::IMMEDIATE: return "immediate";
        case Urgency::WITHIN_HOUR: return "within_hour";
        case Urgency::WITHIN_DAY: return "within_day";
        case Urgency::PLANNED: return "planned";
        default: return "unknown";
    }
}

std::string recommendationPriorityToString(RecommendationPriority priority) {
    switch (priority) {
        case RecommendationPriority::IMMEDIATE: return "immediate";
        case RecommendationPriority::HIGH: return "high";
        case RecommendationPriority::MEDIUM: return "medium";
        case RecommendationPriority::LOW: return "low";
        default: return "unknown";
    }
}

std::string recommendationCategoryToString(RecommendationCategory category) {
    switch (category) {
        case RecommendationCategory::INSPECTION: return "inspection";
        case RecommendationCategory::MAINTENANCE: return "maintenance";
        case RecommendationCategory::REPAIR: return "repair";
        case RecommendationCategory::MONITORING: return "monitoring";
        default: return "unknown";
    }
}

AnomalyType stringToAnomalyType(const std::string& str) {
    std::string lower = toLower(str);

    if (lower == "production_drop") return AnomalyType::PRODUCTION_DROP;
    if (lower == "efficiency_loss") return AnomalyType::EFFICIENCY_LOSS;
    if (lower == "equipment_malfunction") return AnomalyType::EQUIPMENT_MALFUNCTION;
    if (lower == "weather_inconsistency") return AnomalyType::WEATHER_INCONSISTENCY;
    if (lower == "performance_degradation") return AnomalyType::PERFORMANCE_DEGRADATION;
    if (lower == "communication_loss") return AnomalyType::COMMUNICATION_LOSS;
    if (lower == "power_quality_issue") return AnomalyType::POWER_QUALITY_ISSUE;
    if (lower == "seasonal_deviation") return AnomalyType::SEASONAL_DEVIATION;
    if (lower == "peer_comparison_outlier") return AnomalyType::PEER_COMPARISON_OUTLIER;
    if (lower == "predictive_failure") return AnomalyType::PREDICTIVE_FAILURE;
    if (lower == "data_anomaly") return AnomalyType::DATA_ANOMALY;

    throw std::invalid_argument("Unknown anomaly type: " + str);
}

Severity stringToSeverity(const std::string& str) {
    std::string lower = toLower(str);

    if (lower == "info") return Severity::INFO;
    if (lower == "warning") return Severity::WARNING;
    if (lower == "critical") return Severity::CRITICAL;

    throw std::invalid_argument("Unknown severity: " + str);
}

AnomalyStatus stringToAnomalyStatus(const std::string& str) {
    std::string lower = toLower(str);

    if (lower == "active") return AnomalyStatus::ACTIVE;
    if (lower == "investigating") return AnomalyStatus::INVESTIGATING;
    if (lower == "resolved") return AnomalyStatus::RESOLVED;
    if (lower == "false_positive") return AnomalyStatus::FALSE_POSITIVE;

    throw std::invalid_argument("Unknown anomaly status: " + str);
}

} // namespace pv_watch
