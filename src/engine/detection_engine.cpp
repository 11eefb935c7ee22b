#include "pv_watch/engine/detection_engine.h"
#include "pv_watch/core/errors.h"
#include "pv_watch/detection/anomaly_consolidator.h"
#include "pv_watch/utils/time_utils.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace pv_watch {
namespace engine {

using detection::AnomalyConsolidator;
using detection::DetectionConfig;
using detection::DetectorFactory;
using detection::ExclusionType;

std::string detectionStatusToString(DetectionStatus status) {
    switch (status) {
        case DetectionStatus::COMPLETED: return "completed";
        case DetectionStatus::DISABLED: return "disabled";
        case DetectionStatus::EXCLUDED: return "excluded";
        case DetectionStatus::NOT_CONFIGURED: return "not_configured";
        case DetectionStatus::INVALID_INPUT: return "invalid_input";
        case DetectionStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

EngineOptions EngineOptions::fromConfigMap(const ConfigMap& config) {
    EngineOptions options;
    options.history_capacity =
        utils::getConfigValue<size_t>(config, "history_capacity", options.history_capacity);
    options.recent_records =
        utils::getConfigValue<size_t>(config, "recent_records", options.recent_records);
    options.weather_match_minutes =
        utils::getConfigValue<int64_t>(config, "weather_match_minutes", options.weather_match_minutes);
    options.impact_duration_minutes =
        utils::getConfigValue<int>(config, "impact_duration_minutes", options.impact_duration_minutes);
    options.baseline_retry_minutes =
        utils::getConfigValue<int64_t>(config, "baseline_retry_minutes", options.baseline_retry_minutes);
    return options;
}

DetectionEngine::DetectionEngine(std::shared_ptr<TelemetryHistoryProvider> history,
                                 std::shared_ptr<WeatherProvider> weather,
                                 std::shared_ptr<MaintenanceScheduleProvider> maintenance,
                                 const EngineOptions& options)
    : weather_provider_(std::move(weather)),
      maintenance_provider_(std::move(maintenance)),
      options_(options),
      exclusion_evaluator_(options.weather_match_minutes * utils::MS_PER_MINUTE),
      baseline_cache_(std::move(history), options.baseline_retry_minutes * utils::MS_PER_MINUTE) {
}

void DetectionEngine::setListener(std::shared_ptr<AnomalyListener> listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

// ========== Configuration ==========

DetectionEngine::MethodList DetectionEngine::createMethods(const DetectionConfig& config) const {
    MethodList methods;
    for (const auto& name : config.methods) {
        ConfigMap params = config.methodConfig(name);
        params.emplace("weather_match_minutes", std::to_string(options_.weather_match_minutes));

        auto method = DetectorFactory::instance().create(name, params);
        if (!method) {
            throw InvalidInputError("Unknown detection method '" + name +
                                    "' for system '" + config.system_id + "'");
        }
        methods.push_back(std::move(method));
    }
    return methods;
}

BaselineBuilder DetectionEngine::builderFor(const DetectionConfig& config) const {
    return BaselineBuilder({
        {"minimum_data_points", std::to_string(config.minimum_data_points)},
        {"historical_window_days", std::to_string(config.historical_window_days)}
    });
}

void DetectionEngine::configureSystem(const DetectionConfig& config) {
    config.validate();
    MethodList methods = createMethods(config);

    std::shared_ptr<SystemState> existing;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        auto it = systems_.find(config.system_id);
        if (it == systems_.end()) {
            systems_[config.system_id] = std::make_shared<SystemState>(
                config, std::move(methods), options_.history_capacity);
            std::cout << "[DetectionEngine] Configured system " << config.system_id
                      << " with " << config.methods.size() << " methods" << std::endl;
            return;
        }
        existing = it->second;
    }

    {
        std::lock_guard<std::mutex> lock(existing->mutex);
        existing->config = config;
        existing->methods = std::move(methods);
        existing->limiter.setLimits(config.frequency);
    }
    // Window or minimum size may have changed
    baseline_cache_.remove(config.system_id);

    std::cout << "[DetectionEngine] Reconfigured system " << config.system_id << std::endl;
}

bool DetectionEngine::removeSystem(const std::string& system_id) {
    std::shared_ptr<SystemState> state;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mutex_);
        auto it = systems_.find(system_id);
        if (it == systems_.end()) {
            return false;
        }
        state = it->second;
        systems_.erase(it);

        // Under the registry lock, so a detect still running on this system
        // cannot register its anomalies after the purge
        std::unique_lock<std::shared_mutex> owners_lock(owners_mutex_);
        for (auto owner = owners_.begin(); owner != owners_.end();) {
            if (owner->second == system_id) {
                owner = owners_.erase(owner);
            } else {
                ++owner;
            }
        }
    }

    baseline_cache_.remove(system_id);
    return true;
}

bool DetectionEngine::hasSystem(const std::string& system_id) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    return systems_.count(system_id) > 0;
}

std::vector<std::string> DetectionEngine::listSystems() const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    std::vector<std::string> ids;
    for (const auto& pair : systems_) {
        ids.push_back(pair.first);
    }
    return ids;
}

std::optional<DetectionConfig> DetectionEngine::getConfig(const std::string& system_id) const {
    auto state = findSystem(system_id);
    if (!state) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->config;
}

std::shared_ptr<DetectionEngine::SystemState> DetectionEngine::findSystem(
    const std::string& system_id) const {
    std::shared_lock<std::shared_mutex> lock(registry_mutex_);
    auto it = systems_.find(system_id);
    return it != systems_.end() ? it->second : nullptr;
}

std::shared_ptr<DetectionEngine::SystemState> DetectionEngine::findOwner(
    const std::string& anomaly_id) const {
    std::string system_id;
    {
        std::shared_lock<std::shared_mutex> lock(owners_mutex_);
        auto it = owners_.find(anomaly_id);
        if (it == owners_.end()) {
            return nullptr;
        }
        system_id = it->second;
    }
    return findSystem(system_id);
}

// ========== Detection ==========

std::vector<WeatherSample> DetectionEngine::fetchWeather(const std::string& system_id,
                                                         int64_t timestamp,
                                                         DetectionResult& result) const {
    if (!weather_provider_) {
        return {};
    }
    int64_t margin = options_.weather_match_minutes * utils::MS_PER_MINUTE;
    try {
        return weather_provider_->fetchWeather(system_id,
                                               TimeRange(timestamp - margin, timestamp + margin));
    } catch (const std::exception& e) {
        std::cerr << "[DetectionEngine] Weather fetch failed for " << system_id
                  << ": " << e.what() << std::endl;
        result.method_errors.push_back({"weather_provider", e.what()});
        return {};
    }
}

Anomaly DetectionEngine::buildAnomaly(const std::string& system_id,
                                      const AnomalyCandidate& candidate,
                                      const DetectionConfig& config,
                                      int64_t detected_at) const {
    Anomaly anomaly;
    anomaly.system_id = system_id;
    anomaly.timestamp = candidate.timestamp;
    anomaly.detected_at = detected_at;
    anomaly.type = candidate.type;
    anomaly.category = candidate.category;
    anomaly.severity = toSeverity(candidate.level);
    anomaly.score = candidate.score;
    anomaly.confidence = candidate.confidence;
    anomaly.description = candidate.description;
    anomaly.detected_by = candidate.detected_by;
    anomaly.context = candidate.context;
    anomaly.impact = AnomalyConsolidator::estimateImpact(candidate, config.system,
                                                         options_.impact_duration_minutes);
    anomaly.recommendations = catalog_.recommend(anomaly.type, anomaly.severity);
    return anomaly;
}

std::vector<SystemRecommendation> DetectionEngine::systemRecommendations(
    const std::vector<Anomaly>& accepted, const AnomalyHistory& history) const {

    std::vector<SystemRecommendation> recommendations;

    if (accepted.size() > 10) {
        SystemRecommendation r;
        r.type = SystemRecommendation::Type::THRESHOLD_ADJUSTMENT;
        r.description = "Consider adjusting anomaly detection sensitivity";
        r.priority = RecommendationPriority::MEDIUM;
        r.impact = "Reduce false positives";
        recommendations.push_back(r);
    }

    size_t critical = static_cast<size_t>(std::count_if(
        accepted.begin(), accepted.end(),
        [](const Anomaly& a) { return a.severity == Severity::CRITICAL; }));
    if (critical > 2) {
        SystemRecommendation r;
        r.type = SystemRecommendation::Type::MAINTENANCE_SCHEDULING;
        r.description = "Schedule immediate system inspection";
        r.priority = RecommendationPriority::HIGH;
        r.impact = "Address critical issues";
        recommendations.push_back(r);
    }

    AnomalyStatistics stats;
    double score_sum = 0.0;
    history.accumulate(stats, score_sum);
    stats.finalize(score_sum);
    if (stats.reviewed >= 5 && stats.false_positive_rate > 0.3) {
        SystemRecommendation r;
        r.type = SystemRecommendation::Type::MODEL_TUNING;
        r.description = "Retune detection methods, false-positive rate is " +
                        std::to_string(static_cast<int>(stats.false_positive_rate * 100)) + "%";
        r.priority = RecommendationPriority::MEDIUM;
        r.impact = "Improve detection accuracy";
        recommendations.push_back(r);
    }

    return recommendations;
}

DetectionResult DetectionEngine::detect(const std::string& system_id,
                                        const TelemetryRecord& record) {
    DetectionResult result;

    std::shared_ptr<SystemState> state = findSystem(system_id);
    if (!state) {
        result.status = DetectionStatus::NOT_CONFIGURED;
        result.message = "System '" + system_id + "' is not configured";
        return result;
    }

    try {
        validateRecord(record, system_id);
    } catch (const InvalidInputError& e) {
        records_rejected_++;
        result.status = DetectionStatus::INVALID_INPUT;
        result.message = e.what();
        return result;
    }

    try {
        DetectionConfig config;
        MethodList methods;
        std::vector<TelemetryRecord> history;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            config = state->config;
            methods = state->methods;
            history.assign(state->recent.begin(), state->recent.end());
        }

        if (!config.enabled) {
            result.status = DetectionStatus::DISABLED;
            result.message = "Detection disabled for system '" + system_id + "'";
            return result;
        }
        records_processed_++;

        // Collaborator data, fetched without any lock held
        std::vector<WeatherSample> weather = fetchWeather(system_id, record.timestamp, result);
        const std::vector<WeatherSample>* weather_ptr = weather_provider_ ? &weather : nullptr;

        std::vector<detection::MaintenanceWindow> maintenance;
        bool needs_schedule = std::any_of(
            config.exclusions.begin(), config.exclusions.end(),
            [](const detection::ExclusionCondition& c) {
                return c.enabled && !c.predicate && c.type == ExclusionType::MAINTENANCE;
            });
        if (needs_schedule && maintenance_provider_) {
            try {
                maintenance = maintenance_provider_->maintenanceWindows(system_id);
            } catch (const std::exception& e) {
                std::cerr << "[DetectionEngine] Maintenance schedule fetch failed for "
                          << system_id << ": " << e.what() << std::endl;
                result.method_errors.push_back({"maintenance_schedule", e.what()});
            }
        }

        auto exclusion = exclusion_evaluator_.evaluate(config.exclusions, record,
                                                       weather_ptr, &maintenance);
        if (exclusion) {
            records_excluded_++;
            result.status = DetectionStatus::EXCLUDED;
            result.exclusion = exclusion;
            result.message = "Excluded by " + detection::exclusionTypeToString(exclusion->type) +
                             " condition: " + exclusion->condition;
            return result;
        }

        // Baseline
        std::shared_ptr<const Baseline> baseline;
        bool needs_baseline = std::any_of(
            methods.begin(), methods.end(),
            [](const std::shared_ptr<detection::DetectionMethod>& m) {
                return m->requiresBaseline();
            });
        if (needs_baseline) {
            try {
                baseline = baseline_cache_.get(system_id, builderFor(config), record.timestamp);
            } catch (const InsufficientDataError&) {
                result.insufficient_data = true;
            } catch (const std::exception& e) {
                // Upstream failures count as no data; checks without a baseline still run
                std::cerr << "[DetectionEngine] Baseline unavailable for " << system_id
                          << ": " << e.what() << std::endl;
                result.insufficient_data = true;
                result.method_errors.push_back({"baseline", e.what()});
            }
        }

        // Run methods
        detection::DetectionContext context(record);
        context.baseline = baseline.get();
        context.history = &history;
        context.weather = weather_ptr;

        std::vector<AnomalyCandidate> candidates;
        for (const auto& method : methods) {
            if (method->requiresBaseline() && !baseline) {
                result.skipped_methods.push_back(method->name());
                continue;
            }
            try {
                auto found = method->detect(context);
                candidates.insert(candidates.end(), found.begin(), found.end());
            } catch (const std::exception& e) {
                method_failures_++;
                std::cerr << "[DetectionEngine] Method " << method->name() << " failed for "
                          << system_id << ": " << e.what() << std::endl;
                result.method_errors.push_back({method->name(), e.what()});
            }
        }

        // Consolidate and filter
        std::vector<AnomalyCandidate> merged = AnomalyConsolidator::consolidate(candidates);
        result.candidates = merged.size();

        int64_t detected_at = utils::nowMs();
        std::vector<Anomaly> passing;
        for (const auto& candidate : merged) {
            Anomaly anomaly = buildAnomaly(system_id, candidate, config, detected_at);
            if (!AnomalyConsolidator::passesThresholds(anomaly.severity, anomaly.score,
                                                       anomaly.impact, config)) {
                result.filtered_out++;
                continue;
            }
            passing.push_back(std::move(anomaly));
        }

        // Rate limit and store
        std::vector<std::string> evicted;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            for (auto& anomaly : passing) {
                if (!state->limiter.tryAcquire(anomaly.type, anomaly.timestamp)) {
                    result.rate_limited++;
                    continue;
                }
                anomaly.id = "anomaly_" + system_id + "_" + std::to_string(anomaly.timestamp) +
                             "_" + std::to_string(++state->sequence);
                auto dropped = state->history.add(anomaly);
                if (dropped) {
                    evicted.push_back(*dropped);
                }
                result.anomalies.push_back(anomaly);
            }

            state->recent.push_back(record);
            while (state->recent.size() > options_.recent_records) {
                state->recent.pop_front();
            }

            result.system_recommendations =
                systemRecommendations(result.anomalies, state->history);
        }

        if (!evicted.empty() || !result.anomalies.empty()) {
            std::shared_lock<std::shared_mutex> registry_lock(registry_mutex_);
            auto it = systems_.find(system_id);
            if (it != systems_.end() && it->second == state) {
                std::unique_lock<std::shared_mutex> lock(owners_mutex_);
                for (const auto& id : evicted) {
                    owners_.erase(id);
                }
                for (const auto& anomaly : result.anomalies) {
                    owners_[anomaly.id] = system_id;
                }
            }
        }

        anomalies_detected_ += static_cast<int64_t>(result.anomalies.size());
        anomalies_rate_limited_ += static_cast<int64_t>(result.rate_limited);

        // Union of per-anomaly recommendations, most urgent first
        for (const auto& anomaly : result.anomalies) {
            for (const auto& r : anomaly.recommendations) {
                auto same = std::find_if(result.recommendations.begin(), result.recommendations.end(),
                                         [&](const Recommendation& x) { return x.action == r.action; });
                if (same == result.recommendations.end()) {
                    result.recommendations.push_back(r);
                } else if (r.priority < same->priority) {
                    same->priority = r.priority;
                }
            }
        }
        std::stable_sort(result.recommendations.begin(), result.recommendations.end(),
                         [](const Recommendation& a, const Recommendation& b) {
                             return a.priority < b.priority;
                         });

    } catch (const std::exception& e) {
        std::cerr << "[DetectionEngine] Detection failed for " << system_id
                  << ": " << e.what() << std::endl;
        result.status = DetectionStatus::FAILED;
        result.message = e.what();
        result.anomalies.clear();
        result.recommendations.clear();
        result.system_recommendations.clear();
        return result;
    }

    if (!result.anomalies.empty()) {
        notifyDetected(system_id, result.anomalies);
    }
    return result;
}

void DetectionEngine::notifyDetected(const std::string& system_id,
                                     const std::vector<Anomaly>& anomalies) {
    std::shared_ptr<AnomalyListener> listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (!listener) {
        return;
    }
    try {
        listener->onAnomaliesDetected(system_id, anomalies);
    } catch (const std::exception& e) {
        std::cerr << "[DetectionEngine] Listener failed: " << e.what() << std::endl;
    }
}

std::shared_ptr<const Baseline> DetectionEngine::refreshBaseline(const std::string& system_id,
                                                                 std::optional<int64_t> now) {
    auto state = findSystem(system_id);
    if (!state) {
        throw std::out_of_range("System '" + system_id + "' is not configured");
    }

    DetectionConfig config;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        config = state->config;
    }
    return baseline_cache_.get(system_id, builderFor(config),
                               now ? *now : utils::nowMs(), true);
}

// ========== Lifecycle ==========

std::vector<Anomaly> DetectionEngine::listAnomalies(const std::string& system_id,
                                                    const AnomalyFilter& filter) const {
    auto state = findSystem(system_id);
    if (!state) {
        return {};
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->history.list(filter);
}

std::optional<Anomaly> DetectionEngine::getAnomaly(const std::string& anomaly_id) const {
    auto state = findOwner(anomaly_id);
    if (!state) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    const Anomaly* anomaly = state->history.find(anomaly_id);
    if (!anomaly) {
        return std::nullopt;
    }
    return *anomaly;
}

Anomaly DetectionEngine::acknowledge(const std::string& anomaly_id, const std::string& actor_id,
                                     const std::optional<AnomalyFeedback>& feedback) {
    auto state = findOwner(anomaly_id);
    if (!state) {
        throw InvalidStateTransitionError(InvalidStateTransitionError::Reason::NOT_FOUND,
                                          anomaly_id, "Anomaly " + anomaly_id + " not found");
    }

    Anomaly updated;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        updated = state->history.acknowledge(anomaly_id, actor_id, feedback, utils::nowMs());
    }

    std::shared_ptr<AnomalyListener> listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) {
        try {
            listener->onAnomalyAcknowledged(updated);
        } catch (const std::exception& e) {
            std::cerr << "[DetectionEngine] Listener failed: " << e.what() << std::endl;
        }
    }
    return updated;
}

Anomaly DetectionEngine::setStatus(const std::string& anomaly_id, AnomalyStatus status) {
    auto state = findOwner(anomaly_id);
    if (!state) {
        throw InvalidStateTransitionError(InvalidStateTransitionError::Reason::NOT_FOUND,
                                          anomaly_id, "Anomaly " + anomaly_id + " not found");
    }

    Anomaly updated;
    AnomalyStatus previous;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        previous = state->history.setStatus(anomaly_id, status, utils::nowMs());
        updated = *state->history.find(anomaly_id);
    }

    std::shared_ptr<AnomalyListener> listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) {
        try {
            listener->onAnomalyStatusChanged(updated, previous);
        } catch (const std::exception& e) {
            std::cerr << "[DetectionEngine] Listener failed: " << e.what() << std::endl;
        }
    }
    return updated;
}

AnomalyStatistics DetectionEngine::getStatistics(const std::optional<std::string>& system_id) const {
    std::vector<std::shared_ptr<SystemState>> states;
    if (system_id) {
        auto state = findSystem(*system_id);
        if (state) {
            states.push_back(state);
        }
    } else {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        for (const auto& pair : systems_) {
            states.push_back(pair.second);
        }
    }

    AnomalyStatistics stats;
    double score_sum = 0.0;
    for (const auto& state : states) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->history.accumulate(stats, score_sum);
    }
    stats.finalize(score_sum);
    return stats;
}

size_t DetectionEngine::baselineBuildCount(const std::string& system_id) const {
    return baseline_cache_.buildCount(system_id);
}

std::map<std::string, int64_t> DetectionEngine::getStats() const {
    std::map<std::string, int64_t> stats;
    stats["records_processed"] = records_processed_.load();
    stats["records_excluded"] = records_excluded_.load();
    stats["records_rejected"] = records_rejected_.load();
    stats["anomalies_detected"] = anomalies_detected_.load();
    stats["anomalies_rate_limited"] = anomalies_rate_limited_.load();
    stats["method_failures"] = method_failures_.load();
    {
        std::shared_lock<std::shared_mutex> lock(registry_mutex_);
        stats["systems"] = static_cast<int64_t>(systems_.size());
    }
    {
        std::shared_lock<std::shared_mutex> lock(owners_mutex_);
        stats["tracked_anomalies"] = static_cast<int64_t>(owners_.size());
    }
    return stats;
}

} // namespace engine
} // namespace pv_watch
