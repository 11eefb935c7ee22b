#pragma once

#include "pv_watch/detection/detection_method.h"

namespace pv_watch {
namespace detection {

/**
 * @brief Fixed operating-limit checks
 *
 * - performance ratio below pr_min -> production drop
 * - voltage outside [voltage_min, voltage_max] -> equipment fault, critical
 *   when beyond the bound by more than voltage_critical_margin
 * - frequency outside [frequency_min, frequency_max] -> equipment fault,
 *   always critical (anti-islanding)
 *
 * Configuration parameters (defaults): pr_min (0.6), voltage_min (100),
 * voltage_max (800), voltage_critical_margin (0.1), frequency_min (49),
 * frequency_max (61)
 */
class ThresholdDetector : public DetectionMethod {
public:
    explicit ThresholdDetector(const ConfigMap& config = {});

    std::string name() const override { return "threshold_analysis"; }

    std::vector<AnomalyCandidate> detect(const DetectionContext& context) const override;

private:
    void checkPerformanceRatio(const DetectionContext& context,
                               std::vector<AnomalyCandidate>& out) const;
    void checkVoltage(const DetectionContext& context,
                      std::vector<AnomalyCandidate>& out) const;
    void checkFrequency(const DetectionContext& context,
                        std::vector<AnomalyCandidate>& out) const;

    double pr_min_;
    double voltage_min_;
    double voltage_max_;
    double voltage_critical_margin_;
    double frequency_min_;
    double frequency_max_;
};

} // namespace detection
} // namespace pv_watch
