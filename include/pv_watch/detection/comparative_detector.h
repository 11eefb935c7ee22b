#pragma once

#include "pv_watch/detection/detection_method.h"

namespace pv_watch {
namespace detection {

/**
 * @brief Compares actual output with the output the weather should give
 *
 * expected = capacity_kw * (ghi / 1000) * derating, using the weather sample
 * closest to the record within weather_match_minutes. Records with no
 * matching sample, or with no expected output, produce nothing.
 *
 * Configuration parameters (defaults): capacity_kw (10), derating (0.8),
 * deviation_threshold (0.2), weather_match_minutes (30)
 */
class ComparativeDetector : public DetectionMethod {
public:
    explicit ComparativeDetector(const ConfigMap& config = {});

    std::string name() const override { return "comparative_analysis"; }

    std::vector<AnomalyCandidate> detect(const DetectionContext& context) const override;

private:
    double capacity_kw_;
    double derating_;
    double deviation_threshold_;
    int64_t match_window_ms_;
};

} // namespace detection
} // namespace pv_watch
