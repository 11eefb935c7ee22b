#pragma once

#include "pv_watch/core/anomaly.h"
#include "pv_watch/core/system_profile.h"
#include "pv_watch/detection/detection_config.h"
#include <vector>

namespace pv_watch {
namespace detection {

/**
 * @brief Merges, scores and filters candidates from all methods
 *
 * Pure: the same input always yields the same output.
 */
class AnomalyConsolidator {
public:
    /**
     * @brief De-duplicate by (type, category, timestamp)
     *
     * The highest-scoring candidate of each key wins; detected_by is the
     * union of all methods that reported the key. Output keeps first-seen
     * order.
     */
    static std::vector<AnomalyCandidate> consolidate(
        const std::vector<AnomalyCandidate>& candidates);

    /**
     * @brief Estimated impact of a candidate
     *
     * - production_loss: missing power over the duration, kWh
     * - efficiency_drop: score * 5 %
     * - financial_impact: max(loss * rate, score * 2) $
     * - environmental_impact: loss * CO2 factor, kg
     * - urgency: critical -> immediate, warning -> within_day, else planned
     */
    static AnomalyImpact estimateImpact(const AnomalyCandidate& candidate,
                                        const SystemProfile& profile,
                                        int duration_minutes = 60);

    /**
     * @brief Score and impact filter
     * @return false when the score is below its severity threshold, or the
     *         impact is below every impact minimum
     */
    static bool passesThresholds(Severity severity, double score,
                                 const AnomalyImpact& impact,
                                 const DetectionConfig& config);
};

} // namespace detection
} // namespace pv_watch
