#include "pv_watch/detection/recommendation_catalog.h"
#include <algorithm>

namespace pv_watch {
namespace detection {

namespace {

Recommendation entry(const std::string& action,
                     RecommendationPriority priority,
                     RecommendationCategory category,
                     double cost,
                     int minutes,
                     const std::string& benefit,
                     std::vector<std::string> skills) {
    Recommendation r;
    r.action = action;
    r.priority = priority;
    r.category = category;
    r.estimated_cost = cost;
    r.estimated_time_minutes = minutes;
    r.expected_benefit = benefit;
    r.required_skills = std::move(skills);
    return r;
}

} // anonymous namespace

RecommendationCatalog::RecommendationCatalog() {
    using P = RecommendationPriority;
    using C = RecommendationCategory;

    entries_[AnomalyType::PRODUCTION_DROP] = {
        entry("Inspect system for shading or soiling", P::HIGH, C::INSPECTION,
              100, 60, "Restore 5-10% production", {"basic_maintenance"})
    };
    entries_[AnomalyType::EFFICIENCY_LOSS] = {
        entry("Check inverter performance and connections", P::MEDIUM, C::INSPECTION,
              150, 90, "Improve efficiency by 2-5%", {"electrical"})
    };
    entries_[AnomalyType::EQUIPMENT_MALFUNCTION] = {
        entry("Immediate equipment inspection required", P::IMMEDIATE, C::REPAIR,
              300, 120, "Restore full system operation", {"electrical", "certified_technician"})
    };
    entries_[AnomalyType::WEATHER_INCONSISTENCY] = {
        entry("Verify weather data and system response", P::MEDIUM, C::MONITORING,
              50, 30, "Improve detection accuracy", {"data_analysis"})
    };
    entries_[AnomalyType::PERFORMANCE_DEGRADATION] = {
        entry("Schedule comprehensive performance assessment", P::MEDIUM, C::MAINTENANCE,
              200, 180, "Identify degradation causes", {"performance_analysis"})
    };
    entries_[AnomalyType::COMMUNICATION_LOSS] = {
        entry("Check monitoring system connectivity", P::HIGH, C::REPAIR,
              100, 45, "Restore monitoring capability", {"networking"})
    };
    entries_[AnomalyType::POWER_QUALITY_ISSUE] = {
        entry("Analyze power quality and grid connection", P::HIGH, C::INSPECTION,
              250, 120, "Improve power quality", {"electrical", "power_quality"})
    };
    entries_[AnomalyType::SEASONAL_DEVIATION] = {
        entry("Review seasonal patterns and expectations", P::LOW, C::MONITORING,
              0, 15, "Update seasonal models", {"data_analysis"})
    };
    entries_[AnomalyType::PEER_COMPARISON_OUTLIER] = {
        entry("Compare with peer system performance", P::LOW, C::MONITORING,
              50, 30, "Identify improvement opportunities", {"performance_analysis"})
    };
    entries_[AnomalyType::PREDICTIVE_FAILURE] = {
        entry("Schedule preventive maintenance", P::MEDIUM, C::MAINTENANCE,
              200, 120, "Prevent equipment failure", {"preventive_maintenance"})
    };
    entries_[AnomalyType::DATA_ANOMALY] = {
        entry("Verify sensor calibration and monitoring data", P::MEDIUM, C::INSPECTION,
              75, 45, "Restore trustworthy measurements", {"data_analysis"}),
        entry("Check meter and inverter reporting configuration", P::LOW, C::MONITORING,
              0, 20, "Rule out reporting errors", {"networking"})
    };
}

std::vector<Recommendation> RecommendationCatalog::recommend(AnomalyType type,
                                                             Severity severity) const {
    auto it = entries_.find(type);
    if (it == entries_.end()) {
        return {};
    }

    std::vector<Recommendation> result = it->second;
    if (severity == Severity::CRITICAL) {
        for (auto& r : result) {
            // Enum order is most urgent first
            if (r.priority > RecommendationPriority::HIGH) {
                r.priority = RecommendationPriority::HIGH;
            }
        }
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const Recommendation& a, const Recommendation& b) {
                         return a.priority < b.priority;
                     });
    return result;
}

void RecommendationCatalog::set(AnomalyType type, std::vector<Recommendation> recommendations) {
    entries_[type] = std::move(recommendations);
}

} // namespace detection
} // namespace pv_watch
