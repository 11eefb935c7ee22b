#include "pv_watch/detection/seasonal_detector.h"
#include "pv_watch/utils/time_utils.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace pv_watch {
namespace detection {

SeasonalDetector::SeasonalDetector(const ConfigMap& config)
    : DetectionMethod(config),
      deviation_threshold_(utils::getConfigValue<double>(config, "deviation_threshold", 2.0)),
      critical_deviation_(utils::getConfigValue<double>(config, "critical_deviation", 3.0)) {
}

std::vector<AnomalyCandidate> SeasonalDetector::detect(const DetectionContext& context) const {
    std::vector<AnomalyCandidate> candidates;
    if (!context.baseline) {
        return candidates;
    }

    int hour = utils::hourOfDay(context.record.timestamp);
    const auto& profile = context.baseline->hour(hour);
    if (!profile || profile->std_dev <= 0.0) {
        return candidates;
    }

    double value = context.record.production.ac_power;
    double deviation = std::abs(value - profile->mean) / profile->std_dev;
    if (deviation <= deviation_threshold_) {
        return candidates;
    }

    AnomalyCandidate candidate = makeCandidate(
        context, AnomalyType::SEASONAL_DEVIATION, AnomalyCategory::PRODUCTION);
    if (deviation > critical_deviation_) {
        candidate.level = SeverityLevel::CRITICAL;
    } else if (deviation > (deviation_threshold_ + critical_deviation_) / 2.0) {
        candidate.level = SeverityLevel::HIGH;
    } else {
        candidate.level = SeverityLevel::MEDIUM;
    }
    candidate.score = tieredScore(deviation, deviation_threshold_, critical_deviation_,
                                  critical_deviation_ + 1.0);
    candidate.confidence = std::min(deviation / (critical_deviation_ + 1.0), 0.9);

    std::ostringstream desc;
    desc << "AC power " << value << " kW deviates " << deviation
         << " standard deviations from the usual " << profile->mean
         << " kW at " << hour << ":00 UTC";
    candidate.description = desc.str();

    candidate.context.metric = "ac_power";
    candidate.context.current_value = value;
    candidate.context.expected_value = profile->mean;
    candidate.context.deviation = value - profile->mean;
    candidate.context.z_score = (value - profile->mean) / profile->std_dev;

    candidates.push_back(std::move(candidate));
    return candidates;
}

} // namespace detection
} // namespace pv_watch
