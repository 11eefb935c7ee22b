#pragma once

#include "pv_watch/detection/detection_method.h"

namespace pv_watch {
namespace detection {

/**
 * @brief Placeholder for learned pattern recognition
 *
 * Registered so configurations naming it stay valid. Returns no candidates
 * until a trained model is available.
 */
class PatternRecognitionDetector : public DetectionMethod {
public:
    explicit PatternRecognitionDetector(const ConfigMap& config = {})
        : DetectionMethod(config) {}

    std::string name() const override { return "pattern_recognition"; }

    std::vector<AnomalyCandidate> detect(const DetectionContext& /*context*/) const override {
        return {};
    }
};

} // namespace detection
} // namespace pv_watch
