#include "pv_watch/detection/statistical_outlier_detector.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace pv_watch {
namespace detection {

StatisticalOutlierDetector::StatisticalOutlierDetector(const ConfigMap& config)
    : DetectionMethod(config),
      z_threshold_(utils::getConfigValue<double>(config, "z_threshold", 2.5) *
                   sensitivityFactor(config)),
      critical_z_(utils::getConfigValue<double>(config, "critical_z", 3.0)),
      high_z_(utils::getConfigValue<double>(config, "high_z", 2.5)),
      medium_z_(utils::getConfigValue<double>(config, "medium_z", 2.0)),
      low_z_(utils::getConfigValue<double>(config, "low_z", 1.5)) {
}

SeverityLevel StatisticalOutlierDetector::levelFor(double abs_z) const {
    if (abs_z > critical_z_) return SeverityLevel::CRITICAL;
    if (abs_z > high_z_) return SeverityLevel::HIGH;
    if (abs_z > medium_z_) return SeverityLevel::MEDIUM;
    if (abs_z > low_z_) return SeverityLevel::LOW;
    return SeverityLevel::INFO;
}

std::vector<AnomalyCandidate> StatisticalOutlierDetector::detect(
    const DetectionContext& context) const {

    std::vector<AnomalyCandidate> candidates;
    if (!context.baseline) {
        return candidates;
    }

    for (TrackedMetric metric : allTrackedMetrics()) {
        const stats::SummaryStatistics* baseline = context.baseline->metric(metric);
        if (!baseline || baseline->std_dev <= 0.0) {
            continue;
        }

        double value = metricValue(context.record, metric);
        double z = (value - baseline->mean) / baseline->std_dev;
        double abs_z = std::abs(z);
        if (abs_z <= z_threshold_) {
            continue;
        }

        AnomalyType type = metric == TrackedMetric::AC_POWER
            ? AnomalyType::PRODUCTION_DROP
            : AnomalyType::EFFICIENCY_LOSS;
        AnomalyCategory category = metric == TrackedMetric::AC_POWER
            ? AnomalyCategory::PRODUCTION
            : AnomalyCategory::PERFORMANCE;

        AnomalyCandidate candidate = makeCandidate(context, type, category);
        candidate.level = levelFor(abs_z);
        candidate.score = tieredScore(abs_z, medium_z_, critical_z_, critical_z_ + 1.0);
        candidate.confidence = std::min(abs_z / 3.0, 1.0);

        std::ostringstream desc;
        desc << "Statistical outlier in " << trackedMetricLabel(metric)
             << ": value " << value << " is " << abs_z
             << " standard deviations " << (z < 0 ? "below" : "above")
             << " the baseline mean " << baseline->mean;
        candidate.description = desc.str();

        candidate.context.metric = trackedMetricToString(metric);
        candidate.context.current_value = value;
        candidate.context.expected_value = baseline->mean;
        candidate.context.deviation = value - baseline->mean;
        candidate.context.z_score = z;
        candidate.context.historical_range =
            HistoricalRange{baseline->min, baseline->max, baseline->mean, baseline->std_dev};

        candidates.push_back(std::move(candidate));
    }

    return candidates;
}

} // namespace detection
} // namespace pv_watch
