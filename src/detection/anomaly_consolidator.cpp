#include "pv_watch/detection/anomaly_consolidator.h"
#include <algorithm>
#include <map>
#include <tuple>

namespace pv_watch {
namespace detection {

std::vector<AnomalyCandidate> AnomalyConsolidator::consolidate(
    const std::vector<AnomalyCandidate>& candidates) {

    using Key = std::tuple<AnomalyType, AnomalyCategory, int64_t>;

    std::vector<AnomalyCandidate> merged;
    std::map<Key, size_t> index;

    for (const auto& candidate : candidates) {
        Key key{candidate.type, candidate.category, candidate.timestamp};
        auto it = index.find(key);
        if (it == index.end()) {
            index.emplace(key, merged.size());
            merged.push_back(candidate);
            continue;
        }

        AnomalyCandidate& existing = merged[it->second];
        std::vector<std::string> detected_by = existing.detected_by;
        for (const auto& method : candidate.detected_by) {
            if (std::find(detected_by.begin(), detected_by.end(), method) == detected_by.end()) {
                detected_by.push_back(method);
            }
        }

        if (candidate.score > existing.score) {
            existing = candidate;
        }
        existing.detected_by = std::move(detected_by);
    }

    return merged;
}

AnomalyImpact AnomalyConsolidator::estimateImpact(const AnomalyCandidate& candidate,
                                                  const SystemProfile& profile,
                                                  int duration_minutes) {
    AnomalyImpact impact;
    impact.duration_minutes = duration_minutes;
    double hours = duration_minutes / 60.0;

    const AnomalyContext& ctx = candidate.context;
    double shortfall = std::max(0.0, ctx.expected_value - ctx.current_value);
    if (ctx.metric == "ac_power") {
        impact.production_loss = shortfall * hours;
    } else if (ctx.metric == "performance_ratio") {
        impact.production_loss = shortfall * profile.capacity_kw * hours;
    }

    impact.efficiency_drop = candidate.score * 5.0;
    impact.financial_impact = std::max(impact.production_loss * profile.electricity_rate,
                                       candidate.score * 2.0);
    impact.environmental_impact = impact.production_loss * profile.co2_factor;

    switch (toSeverity(candidate.level)) {
        case Severity::CRITICAL:
            impact.urgency = Urgency::IMMEDIATE;
            break;
        case Severity::WARNING:
            impact.urgency = Urgency::WITHIN_DAY;
            break;
        default:
            impact.urgency = Urgency::PLANNED;
            break;
    }

    return impact;
}

bool AnomalyConsolidator::passesThresholds(Severity severity, double score,
                                           const AnomalyImpact& impact,
                                           const DetectionConfig& config) {
    if (score < config.severity_thresholds.forSeverity(severity)) {
        return false;
    }

    const ImpactMinimums& min = config.impact;
    if (impact.production_loss < min.min_production_loss &&
        impact.efficiency_drop < min.min_efficiency_drop &&
        impact.financial_impact < min.min_financial_impact) {
        return false;
    }

    return true;
}

} // namespace detection
} // namespace pv_watch
