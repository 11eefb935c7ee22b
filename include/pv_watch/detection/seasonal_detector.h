#pragma once

#include "pv_watch/detection/detection_method.h"

namespace pv_watch {
namespace detection {

/**
 * @brief AC power against the baseline hour-of-day profile
 *
 * Hours without a profile, or whose profile has no spread, carry no seasonal
 * signal and produce nothing.
 *
 * Configuration parameters (defaults): deviation_threshold (2),
 * critical_deviation (3)
 */
class SeasonalDetector : public DetectionMethod {
public:
    explicit SeasonalDetector(const ConfigMap& config = {});

    std::string name() const override { return "seasonal_anomaly"; }

    bool requiresBaseline() const override { return true; }

    std::vector<AnomalyCandidate> detect(const DetectionContext& context) const override;

private:
    double deviation_threshold_;
    double critical_deviation_;
};

} // namespace detection
} // namespace pv_watch
