#include "pv_watch/detection/comparative_detector.h"
#include "pv_watch/utils/time_utils.h"
#include <sstream>

namespace pv_watch {
namespace detection {

ComparativeDetector::ComparativeDetector(const ConfigMap& config)
    : DetectionMethod(config),
      capacity_kw_(utils::getConfigValue<double>(config, "capacity_kw", 10.0)),
      derating_(utils::getConfigValue<double>(config, "derating", 0.8)),
      deviation_threshold_(utils::getConfigValue<double>(config, "deviation_threshold", 0.2)),
      match_window_ms_(utils::getConfigValue<int64_t>(config, "weather_match_minutes", 30) *
                       utils::MS_PER_MINUTE) {
}

std::vector<AnomalyCandidate> ComparativeDetector::detect(const DetectionContext& context) const {
    std::vector<AnomalyCandidate> candidates;
    if (!context.weather) {
        return candidates;
    }

    const WeatherSample* sample =
        findClosestWeather(*context.weather, context.record.timestamp, match_window_ms_);
    if (!sample) {
        return candidates;
    }

    double expected = capacity_kw_ * (sample->ghi / 1000.0) * derating_;
    if (expected <= 0.0) {
        return candidates;
    }

    double actual = context.record.production.ac_power;
    double deviation = (expected - actual) / expected;
    if (deviation <= deviation_threshold_) {
        return candidates;
    }

    AnomalyCandidate candidate = makeCandidate(
        context, AnomalyType::PRODUCTION_DROP, AnomalyCategory::PERFORMANCE);
    if (deviation > 0.4) {
        candidate.level = SeverityLevel::CRITICAL;
    } else if (deviation > 0.3) {
        candidate.level = SeverityLevel::HIGH;
    } else {
        candidate.level = SeverityLevel::MEDIUM;
    }
    candidate.score = tieredScore(deviation, deviation_threshold_, 0.4, 0.8);
    candidate.confidence = 0.8;

    std::ostringstream desc;
    desc << "Production " << actual << " kW is " << deviation * 100.0
         << "% below the " << expected << " kW expected for "
         << sample->ghi << " W/m² irradiance";
    candidate.description = desc.str();

    candidate.context.metric = "ac_power";
    candidate.context.current_value = actual;
    candidate.context.expected_value = expected;
    candidate.context.deviation = actual - expected;
    if (candidate.context.weather) {
        candidate.context.weather->expected_power = expected;
    }

    candidates.push_back(std::move(candidate));
    return candidates;
}

} // namespace detection
} // namespace pv_watch
