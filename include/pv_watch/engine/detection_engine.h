#pragma once

#include "pv_watch/algorithms/baseline_builder.h"
#include "pv_watch/detection/detection_config.h"
#include "pv_watch/detection/detection_method.h"
#include "pv_watch/detection/exclusion_evaluator.h"
#include "pv_watch/detection/rate_limiter.h"
#include "pv_watch/detection/recommendation_catalog.h"
#include "pv_watch/engine/anomaly_history.h"
#include "pv_watch/engine/baseline_cache.h"
#include "pv_watch/engine/data_providers.h"
#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pv_watch {
namespace engine {

/**
 * @brief Outcome of a detect() call
 */
enum class DetectionStatus {
    COMPLETED,
    DISABLED,         // detection disabled for the system
    EXCLUDED,         // an exclusion condition matched
    NOT_CONFIGURED,   // unknown system
    INVALID_INPUT,    // record rejected by validation
    FAILED            // internal error, nothing stored
};

std::string detectionStatusToString(DetectionStatus status);

struct MethodError {
    std::string method;
    std::string message;
};

/**
 * @brief Result of analysing one record
 */
struct DetectionResult {
    DetectionStatus status = DetectionStatus::COMPLETED;
    std::vector<Anomaly> anomalies;
    std::vector<Recommendation> recommendations;
    std::vector<SystemRecommendation> system_recommendations;
    bool insufficient_data = false;
    std::vector<std::string> skipped_methods;
    std::vector<MethodError> method_errors;
    std::optional<detection::ExclusionMatch> exclusion;
    size_t candidates = 0;     // after consolidation
    size_t filtered_out = 0;   // below score or impact thresholds
    size_t rate_limited = 0;
    std::string message;
};

/**
 * @brief Engine-wide options
 *
 * Configuration parameters:
 * - history_capacity: anomalies kept per system (default 1000)
 * - recent_records: records kept per system for trend analysis (default 100)
 * - weather_match_minutes: weather/record matching distance (default 30)
 * - impact_duration_minutes: assumed anomaly duration (default 60)
 * - baseline_retry_minutes: record time before a too-short history is
 *   fetched again (default 60)
 */
struct EngineOptions {
    size_t history_capacity = 1000;
    size_t recent_records = 100;
    int64_t weather_match_minutes = 30;
    int impact_duration_minutes = 60;
    int64_t baseline_retry_minutes = 60;

    static EngineOptions fromConfigMap(const ConfigMap& config);
};

/**
 * @brief Per-system anomaly detection orchestrator
 *
 * Owns the configuration, baseline cache, rate limiter, anomaly history and
 * recent records of every configured system. Each system is guarded by its
 * own mutex; the registry lock is held only to look systems up or to add and
 * remove them. Detection methods run without any lock held.
 *
 * Orchestration failures are reported through DetectionResult::status, never
 * thrown from detect().
 */
class DetectionEngine {
public:
    DetectionEngine(std::shared_ptr<TelemetryHistoryProvider> history = nullptr,
                    std::shared_ptr<WeatherProvider> weather = nullptr,
                    std::shared_ptr<MaintenanceScheduleProvider> maintenance = nullptr,
                    const EngineOptions& options = {});

    ~DetectionEngine() = default;

    DetectionEngine(const DetectionEngine&) = delete;
    DetectionEngine& operator=(const DetectionEngine&) = delete;

    void setListener(std::shared_ptr<AnomalyListener> listener);

    // ========== Configuration ==========

    /**
     * @brief Add or replace the configuration of a system
     *
     * Replacing keeps the anomaly history and alert counters.
     * @throw InvalidInputError on an invalid configuration or unknown method
     */
    void configureSystem(const detection::DetectionConfig& config);

    /**
     * @brief Forget a system and its anomalies
     * @return false if the system was not configured
     */
    bool removeSystem(const std::string& system_id);

    bool hasSystem(const std::string& system_id) const;

    std::vector<std::string> listSystems() const;

    std::optional<detection::DetectionConfig> getConfig(const std::string& system_id) const;

    // ========== Detection ==========

    /**
     * @brief Analyse one record
     */
    DetectionResult detect(const std::string& system_id, const TelemetryRecord& record);

    /**
     * @brief Rebuild the baseline of a system now
     * @param system_id Configured system
     * @param now Reference time, defaults to the wall clock
     * @throw std::out_of_range for unknown systems
     * @throw InsufficientDataError when the history is too short
     */
    std::shared_ptr<const Baseline> refreshBaseline(const std::string& system_id,
                                                    std::optional<int64_t> now = std::nullopt);

    // ========== Lifecycle ==========

    /**
     * @brief Anomalies of a system, newest first; empty for unknown systems
     */
    std::vector<Anomaly> listAnomalies(const std::string& system_id,
                                       const AnomalyFilter& filter = {}) const;

    std::optional<Anomaly> getAnomaly(const std::string& anomaly_id) const;

    /**
     * @brief Acknowledge an anomaly
     * @throw InvalidStateTransitionError (NOT_FOUND or CONFLICT)
     */
    Anomaly acknowledge(const std::string& anomaly_id, const std::string& actor_id,
                        const std::optional<AnomalyFeedback>& feedback = std::nullopt);

    /**
     * @brief Change the status of an anomaly
     * @throw InvalidStateTransitionError (NOT_FOUND or CONFLICT)
     */
    Anomaly setStatus(const std::string& anomaly_id, AnomalyStatus status);

    /**
     * @brief Statistics of one system, or of all systems
     */
    AnomalyStatistics getStatistics(const std::optional<std::string>& system_id = std::nullopt) const;

    /**
     * @brief Completed baseline rebuilds of a system
     */
    size_t baselineBuildCount(const std::string& system_id) const;

    /**
     * @brief Engine counters
     */
    std::map<std::string, int64_t> getStats() const;

private:
    using MethodList = std::vector<std::shared_ptr<detection::DetectionMethod>>;

    struct SystemState {
        SystemState(const detection::DetectionConfig& cfg, MethodList m, size_t history_capacity)
            : config(cfg),
              methods(std::move(m)),
              limiter(cfg.frequency),
              history(history_capacity) {}

        std::mutex mutex;
        detection::DetectionConfig config;
        MethodList methods;
        detection::RateLimiter limiter;
        AnomalyHistory history;
        std::deque<TelemetryRecord> recent;
        uint64_t sequence = 0;
    };

    std::shared_ptr<SystemState> findSystem(const std::string& system_id) const;

    std::shared_ptr<SystemState> findOwner(const std::string& anomaly_id) const;

    MethodList createMethods(const detection::DetectionConfig& config) const;

    BaselineBuilder builderFor(const detection::DetectionConfig& config) const;

    std::vector<WeatherSample> fetchWeather(const std::string& system_id, int64_t timestamp,
                                            DetectionResult& result) const;

    Anomaly buildAnomaly(const std::string& system_id, const AnomalyCandidate& candidate,
                         const detection::DetectionConfig& config, int64_t detected_at) const;

    std::vector<SystemRecommendation> systemRecommendations(
        const std::vector<Anomaly>& accepted, const AnomalyHistory& history) const;

    void notifyDetected(const std::string& system_id, const std::vector<Anomaly>& anomalies);

    std::shared_ptr<WeatherProvider> weather_provider_;
    std::shared_ptr<MaintenanceScheduleProvider> maintenance_provider_;
    EngineOptions options_;

    detection::ExclusionEvaluator exclusion_evaluator_;
    detection::RecommendationCatalog catalog_;
    BaselineCache baseline_cache_;

    mutable std::shared_mutex registry_mutex_;
    std::map<std::string, std::shared_ptr<SystemState>> systems_;

    // anomaly id -> owning system
    mutable std::shared_mutex owners_mutex_;
    std::unordered_map<std::string, std::string> owners_;

    mutable std::mutex listener_mutex_;
    std::shared_ptr<AnomalyListener> listener_;

    std::atomic<int64_t> records_processed_{0};
    std::atomic<int64_t> records_excluded_{0};
    std::atomic<int64_t> records_rejected_{0};
    std::atomic<int64_t> anomalies_detected_{0};
    std::atomic<int64_t> anomalies_rate_limited_{0};
    std::atomic<int64_t> method_failures_{0};
};

} // namespace engine
} // namespace pv_watch
