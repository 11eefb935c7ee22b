#include "pv_watch/detection/threshold_detector.h"
#include <sstream>

namespace pv_watch {
namespace detection {

ThresholdDetector::ThresholdDetector(const ConfigMap& config)
    : DetectionMethod(config),
      pr_min_(utils::getConfigValue<double>(config, "pr_min", 0.6)),
      voltage_min_(utils::getConfigValue<double>(config, "voltage_min", 100.0)),
      voltage_max_(utils::getConfigValue<double>(config, "voltage_max", 800.0)),
      voltage_critical_margin_(utils::getConfigValue<double>(config, "voltage_critical_margin", 0.1)),
      frequency_min_(utils::getConfigValue<double>(config, "frequency_min", 49.0)),
      frequency_max_(utils::getConfigValue<double>(config, "frequency_max", 61.0)) {
}

std::vector<AnomalyCandidate> ThresholdDetector::detect(const DetectionContext& context) const {
    std::vector<AnomalyCandidate> candidates;
    checkPerformanceRatio(context, candidates);
    checkVoltage(context, candidates);
    checkFrequency(context, candidates);
    return candidates;
}

void ThresholdDetector::checkPerformanceRatio(const DetectionContext& context,
                                              std::vector<AnomalyCandidate>& out) const {
    double pr = context.record.performance.performance_ratio;
    if (pr_min_ <= 0.0 || pr >= pr_min_) {
        return;
    }

    double shortfall = (pr_min_ - pr) / pr_min_;

    AnomalyCandidate candidate = makeCandidate(
        context, AnomalyType::PRODUCTION_DROP, AnomalyCategory::PRODUCTION);
    if (shortfall > 0.3) {
        candidate.level = SeverityLevel::CRITICAL;
    } else if (shortfall > 0.2) {
        candidate.level = SeverityLevel::HIGH;
    } else if (shortfall > 0.1) {
        candidate.level = SeverityLevel::MEDIUM;
    } else {
        candidate.level = SeverityLevel::LOW;
    }
    candidate.score = tieredScore(shortfall, 0.1, 0.3, 0.6);
    candidate.confidence = 0.9;

    std::ostringstream desc;
    desc << "Performance ratio " << pr << " below minimum " << pr_min_;
    candidate.description = desc.str();

    candidate.context.metric = "performance_ratio";
    candidate.context.current_value = pr;
    candidate.context.expected_value = pr_min_;
    candidate.context.deviation = pr - pr_min_;

    out.push_back(std::move(candidate));
}

void ThresholdDetector::checkVoltage(const DetectionContext& context,
                                     std::vector<AnomalyCandidate>& out) const {
    double voltage = context.record.production.voltage;
    double bound;
    double excess;
    if (voltage < voltage_min_) {
        bound = voltage_min_;
        excess = voltage_min_ > 0.0 ? (voltage_min_ - voltage) / voltage_min_ : 0.0;
    } else if (voltage > voltage_max_) {
        bound = voltage_max_;
        excess = (voltage - voltage_max_) / voltage_max_;
    } else {
        return;
    }

    AnomalyCandidate candidate = makeCandidate(
        context, AnomalyType::EQUIPMENT_MALFUNCTION, AnomalyCategory::EQUIPMENT_FAULT);
    if (excess > voltage_critical_margin_) {
        candidate.level = SeverityLevel::CRITICAL;
        candidate.score = 0.95;
    } else {
        candidate.level = SeverityLevel::HIGH;
        candidate.score = 0.85;
    }
    candidate.confidence = 0.95;

    std::ostringstream desc;
    desc << "Voltage " << voltage << " V outside operating range ["
         << voltage_min_ << ", " << voltage_max_ << "] V";
    candidate.description = desc.str();

    candidate.context.metric = "voltage";
    candidate.context.current_value = voltage;
    candidate.context.expected_value = bound;
    candidate.context.deviation = voltage - bound;

    out.push_back(std::move(candidate));
}

void ThresholdDetector::checkFrequency(const DetectionContext& context,
                                       std::vector<AnomalyCandidate>& out) const {
    double frequency = context.record.production.frequency;
    if (frequency >= frequency_min_ && frequency <= frequency_max_) {
        return;
    }
    double bound = frequency < frequency_min_ ? frequency_min_ : frequency_max_;

    AnomalyCandidate candidate = makeCandidate(
        context, AnomalyType::EQUIPMENT_MALFUNCTION, AnomalyCategory::EQUIPMENT_FAULT);
    candidate.level = SeverityLevel::CRITICAL;
    candidate.score = 1.0;
    candidate.confidence = 0.98;

    std::ostringstream desc;
    desc << "Grid frequency " << frequency << " Hz outside ["
         << frequency_min_ << ", " << frequency_max_ << "] Hz, anti-islanding risk";
    candidate.description = desc.str();

    candidate.context.metric = "frequency";
    candidate.context.current_value = frequency;
    candidate.context.expected_value = bound;
    candidate.context.deviation = frequency - bound;

    out.push_back(std::move(candidate));
}

} // namespace detection
} // namespace pv_watch
