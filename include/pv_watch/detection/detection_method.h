#pragma once

#include "pv_watch/algorithms/baseline_builder.h"
#include "pv_watch/core/anomaly.h"
#include "pv_watch/core/telemetry_record.h"
#include "pv_watch/utils/config.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pv_watch {
namespace detection {

/**
 * @brief Inputs available to a detection method for one record
 *
 * Pointers are null when the orchestrator has no such input. History is
 * ordered oldest first and does not include the record itself.
 */
struct DetectionContext {
    explicit DetectionContext(const TelemetryRecord& r) : record(r) {}

    const TelemetryRecord& record;
    const Baseline* baseline = nullptr;
    const std::vector<TelemetryRecord>* history = nullptr;
    const std::vector<WeatherSample>* weather = nullptr;
};

/**
 * @brief Base class for anomaly detection strategies
 *
 * Methods are constructed from a key/value parameter map and are stateless
 * afterwards: detect() may be called concurrently from several threads.
 * Every numeric constant a method uses is a parameter with a default.
 *
 * Common parameter:
 * - sensitivity: low | medium | high
 */
class DetectionMethod {
public:
    explicit DetectionMethod(const ConfigMap& config = {})
        : config_(config) {}

    virtual ~DetectionMethod() = default;

    /**
     * @brief Registry name, also reported in Anomaly::detected_by
     */
    virtual std::string name() const = 0;

    /**
     * @brief Whether the method is skipped when no baseline is available
     */
    virtual bool requiresBaseline() const {
        return false;
    }

    /**
     * @brief Analyse one record
     * @param context Record plus optional baseline, history and weather
     * @return Zero or more candidates
     */
    virtual std::vector<AnomalyCandidate> detect(const DetectionContext& context) const = 0;

    const ConfigMap& get_config() const {
        return config_;
    }

    std::string get_config(const std::string& key,
                           const std::string& default_value = "") const {
        auto it = config_.find(key);
        return (it != config_.end()) ? it->second : default_value;
    }

protected:
    /**
     * @brief Candidate pre-filled with timestamp, detector name and the
     *        calendar, baseline and weather context of the record
     */
    AnomalyCandidate makeCandidate(const DetectionContext& context,
                                   AnomalyType type,
                                   AnomalyCategory category) const;

    ConfigMap config_;
};

/**
 * @brief Map a deviation onto a [0,1] score aligned with severity tiers
 *
 * Below medium_boundary the score rises linearly to 0.6, between the medium
 * and critical boundaries it spans [0.6, 0.8), and from the critical boundary
 * it reaches 1.0 at saturation.
 */
double tieredScore(double deviation, double medium_boundary,
                   double critical_boundary, double saturation);

/**
 * @brief Threshold multiplier for a sensitivity setting
 *
 * high -> 0.8, medium -> 1.0, low -> 1.2
 */
double sensitivityFactor(const ConfigMap& config);

/**
 * @brief Registry of detection methods by name
 *
 * Built-in methods are registered on first use:
 * statistical_outlier, threshold_analysis, trend_analysis,
 * comparative_analysis, physics_based, seasonal_anomaly, pattern_recognition.
 */
class DetectorFactory {
public:
    using Creator = std::function<std::shared_ptr<DetectionMethod>(const ConfigMap&)>;

    static DetectorFactory& instance();

    /**
     * @brief Register or replace a method
     */
    void register_detector(const std::string& name, Creator creator);

    /**
     * @brief Create a method
     * @return nullptr when the name is unknown
     */
    std::shared_ptr<DetectionMethod> create(const std::string& name,
                                            const ConfigMap& config = {}) const;

    bool has_detector(const std::string& name) const;

    std::vector<std::string> list_detectors() const;

private:
    DetectorFactory();

    mutable std::mutex mutex_;
    std::map<std::string, Creator> creators_;
};

} // namespace detection
} // namespace pv_watch
