#pragma once

#include "pv_watch/detection/detection_method.h"

namespace pv_watch {
namespace detection {

/**
 * @brief Physically impossible readings
 *
 * AC output above DC input beyond the tolerance, or efficiency above what a
 * module can achieve, indicate a measurement problem and are reported as
 * data anomalies, never as equipment faults.
 *
 * Configuration parameters (defaults): ac_dc_tolerance (1.05),
 * max_module_efficiency (25)
 */
class PhysicsDetector : public DetectionMethod {
public:
    explicit PhysicsDetector(const ConfigMap& config = {});

    std::string name() const override { return "physics_based"; }

    std::vector<AnomalyCandidate> detect(const DetectionContext& context) const override;

private:
    double ac_dc_tolerance_;
    double max_module_efficiency_;
};

} // namespace detection
} // namespace pv_watch
