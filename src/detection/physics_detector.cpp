#include "pv_watch/detection/physics_detector.h"
#include <sstream>

namespace pv_watch {
namespace detection {

PhysicsDetector::PhysicsDetector(const ConfigMap& config)
    : DetectionMethod(config),
      ac_dc_tolerance_(utils::getConfigValue<double>(config, "ac_dc_tolerance", 1.05)),
      max_module_efficiency_(utils::getConfigValue<double>(config, "max_module_efficiency", 25.0)) {
}

std::vector<AnomalyCandidate> PhysicsDetector::detect(const DetectionContext& context) const {
    std::vector<AnomalyCandidate> candidates;
    const ProductionMetrics& production = context.record.production;

    // Inverter cannot output more than it receives
    double dc_limit = production.dc_power * ac_dc_tolerance_;
    if (production.ac_power > dc_limit) {
        AnomalyCandidate candidate = makeCandidate(
            context, AnomalyType::DATA_ANOMALY, AnomalyCategory::DATA);
        candidate.level = SeverityLevel::MEDIUM;
        candidate.score = 0.7;
        candidate.confidence = 0.95;

        std::ostringstream desc;
        desc << "AC power " << production.ac_power << " kW exceeds DC power "
             << production.dc_power << " kW, likely a measurement error";
        candidate.description = desc.str();

        candidate.context.metric = "ac_power";
        candidate.context.current_value = production.ac_power;
        candidate.context.expected_value = dc_limit;
        candidate.context.deviation = production.ac_power - dc_limit;

        candidates.push_back(std::move(candidate));
    }

    double efficiency = context.record.performance.efficiency;
    if (efficiency > max_module_efficiency_) {
        AnomalyCandidate candidate = makeCandidate(
            context, AnomalyType::DATA_ANOMALY, AnomalyCategory::DATA);
        candidate.level = SeverityLevel::MEDIUM;
        candidate.score = 0.65;
        candidate.confidence = 0.9;

        std::ostringstream desc;
        desc << "Efficiency " << efficiency << "% exceeds the physical maximum of "
             << max_module_efficiency_ << "%";
        candidate.description = desc.str();

        candidate.context.metric = "efficiency";
        candidate.context.current_value = efficiency;
        candidate.context.expected_value = max_module_efficiency_;
        candidate.context.deviation = efficiency - max_module_efficiency_;

        candidates.push_back(std::move(candidate));
    }

    return candidates;
}

} // namespace detection
} // namespace pv_watch
