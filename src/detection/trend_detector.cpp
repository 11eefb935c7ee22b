#include "pv_watch/detection/trend_detector.h"
#include "pv_watch/algorithms/statistics.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace pv_watch {
namespace detection {

TrendDetector::TrendDetector(const ConfigMap& config)
    : DetectionMethod(config),
      window_(std::max<size_t>(10, utils::getConfigValue<size_t>(config, "window", 10))),
      slope_threshold_(utils::getConfigValue<double>(config, "slope_threshold", -0.01)) {
}

std::vector<AnomalyCandidate> TrendDetector::detect(const DetectionContext& context) const {
    std::vector<AnomalyCandidate> candidates;
    if (!context.history || context.history->size() < window_) {
        return candidates;
    }

    const auto& history = *context.history;
    std::vector<double> pr;
    pr.reserve(window_);
    for (size_t i = history.size() - window_; i < history.size(); ++i) {
        pr.push_back(history[i].performance.performance_ratio);
    }

    stats::LinearFit fit = stats::fitTrend(pr);
    if (fit.slope >= slope_threshold_) {
        return candidates;
    }

    double magnitude = std::abs(fit.slope) * 100.0;

    AnomalyCandidate candidate = makeCandidate(
        context, AnomalyType::PERFORMANCE_DEGRADATION, AnomalyCategory::PERFORMANCE);
    if (magnitude > 5.0) {
        candidate.level = SeverityLevel::CRITICAL;
    } else if (magnitude > 3.0) {
        candidate.level = SeverityLevel::HIGH;
    } else if (magnitude > 2.0) {
        candidate.level = SeverityLevel::MEDIUM;
    } else {
        candidate.level = SeverityLevel::LOW;
    }
    candidate.score = tieredScore(magnitude, 2.0, 5.0, 8.0);
    candidate.confidence = std::clamp(fit.r_squared, 0.0, 0.95);

    std::ostringstream desc;
    desc << "Performance ratio declining by " << magnitude
         << "% per sample over the last " << window_ << " samples";
    candidate.description = desc.str();

    double fitted_end = fit.intercept + fit.slope * static_cast<double>(window_ - 1);
    candidate.context.metric = "performance_ratio";
    candidate.context.current_value = pr.back();
    candidate.context.expected_value = fit.intercept;
    candidate.context.deviation = fitted_end - fit.intercept;

    candidates.push_back(std::move(candidate));
    return candidates;
}

} // namespace detection
} // namespace pv_watch
