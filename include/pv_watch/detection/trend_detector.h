#pragma once

#include "pv_watch/detection/detection_method.h"

namespace pv_watch {
namespace detection {

/**
 * @brief Declining performance-ratio trend over recent history
 *
 * Fits an ordinary least squares line to the last `window` performance-ratio
 * values of the history (the analysed record is not part of the fit).
 *
 * Configuration parameters:
 * - window: samples in the fit, at least 10 (default 10)
 * - slope_threshold: flag when the slope per sample is below it (default -0.01)
 */
class TrendDetector : public DetectionMethod {
public:
    explicit TrendDetector(const ConfigMap& config = {});

    std::string name() const override { return "trend_analysis"; }

    std::vector<AnomalyCandidate> detect(const DetectionContext& context) const override;

    size_t window() const { return window_; }

private:
    size_t window_;
    double slope_threshold_;
};

} // namespace detection
} // namespace pv_watch
