#pragma once

#include "pv_watch/detection/detection_method.h"

namespace pv_watch {
namespace detection {

/**
 * @brief Z-score outliers of AC power, performance ratio and efficiency
 *
 * Each metric is scored against its own baseline distribution; metrics whose
 * baseline spread is zero are skipped.
 *
 * Configuration parameters:
 * - z_threshold: flag when |z| exceeds it (default 2.5, scaled by sensitivity)
 * - critical_z, high_z, medium_z, low_z: severity tiers (3, 2.5, 2, 1.5)
 */
class StatisticalOutlierDetector : public DetectionMethod {
public:
    explicit StatisticalOutlierDetector(const ConfigMap& config = {});

    std::string name() const override { return "statistical_outlier"; }

    bool requiresBaseline() const override { return true; }

    std::vector<AnomalyCandidate> detect(const DetectionContext& context) const override;

    double effectiveThreshold() const { return z_threshold_; }

private:
    SeverityLevel levelFor(double abs_z) const;

    double z_threshold_;
    double critical_z_;
    double high_z_;
    double medium_z_;
    double low_z_;
};

} // namespace detection
} // namespace pv_watch
