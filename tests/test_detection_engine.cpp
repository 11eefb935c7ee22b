#include <gtest/gtest.h>
#include "pv_watch/core/errors.h"
#include "pv_watch/engine/detection_engine.h"
#include "pv_watch/engine/telemetry_store.h"
#include "pv_watch/utils/time_utils.h"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace pv_watch;
using namespace pv_watch::engine;
using namespace pv_watch::detection;

namespace {

// Reports a production drop on every record
class FixedDetector : public DetectionMethod {
public:
    FixedDetector(std::string name, const ConfigMap& config)
        : DetectionMethod(config), name_(std::move(name)) {}

    std::string name() const override { return name_; }

    std::vector<AnomalyCandidate> detect(const DetectionContext& context) const override {
        AnomalyCandidate c = makeCandidate(context, AnomalyType::PRODUCTION_DROP,
                                           AnomalyCategory::PRODUCTION);
        c.level = SeverityLevel::CRITICAL;
        c.score = utils::getConfigValue<double>(config_, "score", 0.9);
        c.confidence = 0.9;
        c.description = "Fixed production drop";
        c.context.metric = "ac_power";
        c.context.current_value = context.record.production.ac_power;
        c.context.expected_value = 5.0;
        return {c};
    }

private:
    std::string name_;
};

class ThrowingDetector : public DetectionMethod {
public:
    using DetectionMethod::DetectionMethod;

    std::string name() const override { return "test_throwing"; }

    std::vector<AnomalyCandidate> detect(const DetectionContext&) const override {
        throw std::runtime_error("model exploded");
    }
};

// Needs a baseline; reports a data anomaly once it has one
class BaselineDetector : public DetectionMethod {
public:
    using DetectionMethod::DetectionMethod;

    std::string name() const override { return "test_baseline"; }

    bool requiresBaseline() const override { return true; }

    std::vector<AnomalyCandidate> detect(const DetectionContext& context) const override {
        AnomalyCandidate c = makeCandidate(context, AnomalyType::DATA_ANOMALY,
                                           AnomalyCategory::DATA);
        c.level = SeverityLevel::HIGH;
        c.score = 0.7;
        c.confidence = 0.8;
        c.description = "Baseline seen with " +
                        std::to_string(context.baseline->sample_count) + " samples";
        return {c};
    }
};

// Blocks inside detect() until released
class GatedDetector : public DetectionMethod {
public:
    using DetectionMethod::DetectionMethod;

    std::string name() const override { return "test_gated"; }

    std::vector<AnomalyCandidate> detect(const DetectionContext& context) const override {
        entered = true;
        while (!released) {
            std::this_thread::yield();
        }
        AnomalyCandidate c = makeCandidate(context, AnomalyType::PRODUCTION_DROP,
                                           AnomalyCategory::PRODUCTION);
        c.level = SeverityLevel::CRITICAL;
        c.score = 0.9;
        c.confidence = 0.9;
        c.context.metric = "ac_power";
        c.context.current_value = context.record.production.ac_power;
        c.context.expected_value = 5.0;
        return {c};
    }

    static std::atomic<bool> entered;
    static std::atomic<bool> released;
};

std::atomic<bool> GatedDetector::entered{false};
std::atomic<bool> GatedDetector::released{false};

class FailingHistory : public TelemetryHistoryProvider {
public:
    explicit FailingHistory(bool typed) : typed_(typed) {}

    std::vector<TelemetryRecord> fetchHistory(const std::string&, const TimeRange&) override {
        if (typed_) {
            throw UpstreamFetchError("history service returned 503");
        }
        throw std::runtime_error("connection reset by peer");
    }

private:
    bool typed_;
};

class CountingHistory : public TelemetryHistoryProvider {
public:
    std::vector<TelemetryRecord> fetchHistory(const std::string&, const TimeRange&) override {
        fetches++;
        return {};
    }

    std::atomic<size_t> fetches{0};
};

class RecordingListener : public AnomalyListener {
public:
    void onAnomaliesDetected(const std::string&, const std::vector<Anomaly>& anomalies) override {
        detected += anomalies.size();
        if (throw_on_detect) {
            throw std::runtime_error("listener down");
        }
    }

    void onAnomalyAcknowledged(const Anomaly&) override { acknowledged++; }

    void onAnomalyStatusChanged(const Anomaly& anomaly, AnomalyStatus previous) override {
        last_previous = previous;
        last_status = anomaly.status;
        status_changes++;
    }

    size_t detected = 0;
    size_t acknowledged = 0;
    size_t status_changes = 0;
    AnomalyStatus last_previous = AnomalyStatus::ACTIVE;
    AnomalyStatus last_status = AnomalyStatus::ACTIVE;
    bool throw_on_detect = false;
};

} // namespace

class DetectionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& factory = DetectorFactory::instance();
        factory.register_detector("test_fixed", [](const ConfigMap& c) {
            return std::make_shared<FixedDetector>("test_fixed", c);
        });
        factory.register_detector("test_fixed_twin", [](const ConfigMap& c) {
            return std::make_shared<FixedDetector>("test_fixed_twin", c);
        });
        factory.register_detector("test_throwing", [](const ConfigMap& c) {
            return std::make_shared<ThrowingDetector>(c);
        });
        factory.register_detector("test_baseline", [](const ConfigMap& c) {
            return std::make_shared<BaselineDetector>(c);
        });

        store_ = std::make_shared<TelemetryStore>();
        maintenance_ = std::make_shared<MaintenanceSchedule>();
        listener_ = std::make_shared<RecordingListener>();
        engine_ = std::make_unique<DetectionEngine>(store_, nullptr, maintenance_);
        engine_->setListener(listener_);

        t0_ = utils::fromCivil(2024, 5, 1) + 10 * utils::MS_PER_HOUR;
    }

    DetectionConfig makeConfig(const std::string& system_id,
                               std::vector<std::string> methods = {"test_fixed"}) {
        DetectionConfig config;
        config.system_id = system_id;
        config.methods = std::move(methods);
        config.minimum_data_points = 24;
        config.frequency = FrequencyLimits{1000, 1000, 0};
        return config;
    }

    TelemetryRecord makeRecord(const std::string& system_id, int64_t ts) {
        TelemetryRecord record(system_id, ts);
        record.production.ac_power = 2.0;
        record.production.dc_power = 2.1;
        record.production.energy_delta = 2.0;
        record.production.voltage = 400.0;
        record.production.frequency = 50.0;
        record.environmental.irradiance = 800.0;
        record.performance.performance_ratio = 0.8;
        record.performance.efficiency = 18.0;
        return record;
    }

    std::shared_ptr<TelemetryStore> store_;
    std::shared_ptr<MaintenanceSchedule> maintenance_;
    std::shared_ptr<RecordingListener> listener_;
    std::unique_ptr<DetectionEngine> engine_;
    int64_t t0_ = 0;
};

TEST_F(DetectionEngineTest, UnknownSystemIsNotConfigured) {
    DetectionResult result = engine_->detect("pv-404", makeRecord("pv-404", t0_));
    EXPECT_EQ(result.status, DetectionStatus::NOT_CONFIGURED);
    EXPECT_TRUE(result.anomalies.empty());
    EXPECT_TRUE(engine_->listAnomalies("pv-404").empty());
}

TEST_F(DetectionEngineTest, ConfigureRejectsUnknownMethod) {
    EXPECT_THROW(engine_->configureSystem(makeConfig("pv-001", {"no_such_method"})),
                 InvalidInputError);
    EXPECT_FALSE(engine_->hasSystem("pv-001"));

    DetectionConfig bad = makeConfig("pv-001");
    bad.severity_thresholds.warning = 0.9;
    EXPECT_THROW(engine_->configureSystem(bad), InvalidInputError);
}

TEST_F(DetectionEngineTest, InvalidRecordsAreRejected) {
    engine_->configureSystem(makeConfig("pv-001"));

    DetectionResult wrong_system = engine_->detect("pv-001", makeRecord("pv-002", t0_));
    EXPECT_EQ(wrong_system.status, DetectionStatus::INVALID_INPUT);

    TelemetryRecord nan_power = makeRecord("pv-001", t0_);
    nan_power.production.ac_power = std::numeric_limits<double>::quiet_NaN();
    DetectionResult nan_result = engine_->detect("pv-001", nan_power);
    EXPECT_EQ(nan_result.status, DetectionStatus::INVALID_INPUT);
    EXPECT_FALSE(nan_result.message.empty());

    EXPECT_EQ(engine_->getStats()["records_rejected"], 2);
    EXPECT_TRUE(engine_->listAnomalies("pv-001").empty());
}

TEST_F(DetectionEngineTest, DisabledSystem) {
    DetectionConfig config = makeConfig("pv-001");
    config.enabled = false;
    engine_->configureSystem(config);

    DetectionResult result = engine_->detect("pv-001", makeRecord("pv-001", t0_));
    EXPECT_EQ(result.status, DetectionStatus::DISABLED);
    EXPECT_TRUE(result.anomalies.empty());
    EXPECT_EQ(listener_->detected, 0u);
}

TEST_F(DetectionEngineTest, GridOutageIsExcluded) {
    DetectionConfig config = makeConfig("pv-001");
    config.exclusions = {ExclusionCondition::grid()};
    engine_->configureSystem(config);

    TelemetryRecord outage = makeRecord("pv-001", t0_);
    outage.production.voltage = 0.0;
    DetectionResult result = engine_->detect("pv-001", outage);

    EXPECT_EQ(result.status, DetectionStatus::EXCLUDED);
    ASSERT_TRUE(result.exclusion.has_value());
    EXPECT_EQ(result.exclusion->type, ExclusionType::GRID);
    EXPECT_TRUE(result.anomalies.empty());
    EXPECT_EQ(engine_->getStats()["records_excluded"], 1);
}

TEST_F(DetectionEngineTest, MaintenanceWindowIsExcluded) {
    DetectionConfig config = makeConfig("pv-001");
    config.exclusions = {ExclusionCondition::maintenance()};
    engine_->configureSystem(config);
    maintenance_->schedule("pv-001", {t0_ + utils::MS_PER_HOUR, t0_ + 3 * utils::MS_PER_HOUR,
                                      "String replacement"});

    EXPECT_EQ(engine_->detect("pv-001", makeRecord("pv-001", t0_)).status,
              DetectionStatus::EXCLUDED);
    EXPECT_EQ(engine_->detect("pv-001", makeRecord("pv-001", t0_ + 6 * utils::MS_PER_HOUR)).status,
              DetectionStatus::COMPLETED);
}

TEST_F(DetectionEngineTest, AcceptedAnomalyIsStored) {
    engine_->configureSystem(makeConfig("pv-001"));

    DetectionResult result = engine_->detect("pv-001", makeRecord("pv-001", t0_));
    ASSERT_EQ(result.status, DetectionStatus::COMPLETED);
    ASSERT_EQ(result.anomalies.size(), 1u);

    const Anomaly& anomaly = result.anomalies[0];
    EXPECT_EQ(anomaly.id, "anomaly_pv-001_" + std::to_string(t0_) + "_1");
    EXPECT_EQ(anomaly.system_id, "pv-001");
    EXPECT_EQ(anomaly.severity, Severity::CRITICAL);
    EXPECT_EQ(anomaly.status, AnomalyStatus::ACTIVE);
    EXPECT_DOUBLE_EQ(anomaly.impact.production_loss, 3.0);
    EXPECT_EQ(anomaly.impact.urgency, Urgency::IMMEDIATE);
    ASSERT_FALSE(anomaly.recommendations.empty());
    EXPECT_EQ(anomaly.recommendations[0].action, "Inspect system for shading or soiling");
    ASSERT_FALSE(result.recommendations.empty());

    auto stored = engine_->getAnomaly(anomaly.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->timestamp, t0_);
    EXPECT_EQ(engine_->listAnomalies("pv-001").size(), 1u);
    EXPECT_EQ(listener_->detected, 1u);
}

TEST_F(DetectionEngineTest, MethodsReportingSameAnomalyAreMerged) {
    engine_->configureSystem(makeConfig("pv-001", {"test_fixed", "test_fixed_twin"}));

    DetectionResult result = engine_->detect("pv-001", makeRecord("pv-001", t0_));
    EXPECT_EQ(result.candidates, 1u);
    ASSERT_EQ(result.anomalies.size(), 1u);
    EXPECT_EQ(result.anomalies[0].detected_by.size(), 2u);
}

TEST_F(DetectionEngineTest, FailingMethodIsIsolated) {
    engine_->configureSystem(makeConfig("pv-001", {"test_throwing", "test_fixed"}));

    DetectionResult result = engine_->detect("pv-001", makeRecord("pv-001", t0_));
    EXPECT_EQ(result.status, DetectionStatus::COMPLETED);
    ASSERT_EQ(result.method_errors.size(), 1u);
    EXPECT_EQ(result.method_errors[0].method, "test_throwing");
    EXPECT_EQ(result.method_errors[0].message, "model exploded");
    EXPECT_EQ(result.anomalies.size(), 1u);
    EXPECT_EQ(engine_->getStats()["method_failures"], 1);
}

TEST_F(DetectionEngineTest, InsufficientHistorySkipsBaselineMethods) {
    engine_->configureSystem(makeConfig("pv-001", {"test_baseline", "test_fixed"}));

    // 10 records, fewer than the 24 required
    for (int i = 0; i < 10; ++i) {
        store_->add(makeRecord("pv-001", t0_ + i * utils::MS_PER_HOUR));
    }
    int64_t ts = t0_ + 30 * utils::MS_PER_HOUR;
    DetectionResult result = engine_->detect("pv-001", makeRecord("pv-001", ts));

    EXPECT_EQ(result.status, DetectionStatus::COMPLETED);
    EXPECT_TRUE(result.insufficient_data);
    ASSERT_EQ(result.skipped_methods.size(), 1u);
    EXPECT_EQ(result.skipped_methods[0], "test_baseline");
    ASSERT_EQ(result.anomalies.size(), 1u);
    EXPECT_EQ(result.anomalies[0].type, AnomalyType::PRODUCTION_DROP);

    for (int i = 10; i < 30; ++i) {
        store_->add(makeRecord("pv-001", t0_ + i * utils::MS_PER_HOUR));
    }
    // Past the retry interval for a short history
    result = engine_->detect("pv-001", makeRecord("pv-001", ts + 2 * utils::MS_PER_HOUR));
    EXPECT_FALSE(result.insufficient_data);
    EXPECT_TRUE(result.skipped_methods.empty());
    bool has_data_anomaly = std::any_of(result.anomalies.begin(), result.anomalies.end(),
                                        [](const Anomaly& a) {
                                            return a.type == AnomalyType::DATA_ANOMALY;
                                        });
    EXPECT_TRUE(has_data_anomaly);
}

TEST_F(DetectionEngineTest, LowScoreIsFilteredOut) {
    DetectionConfig config = makeConfig("pv-001");
    config.method_params["test_fixed"]["score"] = "0.5";
    engine_->configureSystem(config);

    DetectionResult result = engine_->detect("pv-001", makeRecord("pv-001", t0_));
    EXPECT_EQ(result.status, DetectionStatus::COMPLETED);
    EXPECT_EQ(result.candidates, 1u);
    EXPECT_EQ(result.filtered_out, 1u);
    EXPECT_TRUE(result.anomalies.empty());
    EXPECT_EQ(listener_->detected, 0u);
}

TEST_F(DetectionEngineTest, DailyCapLimitsAlerts) {
    DetectionConfig config = makeConfig("pv-001");
    config.frequency = FrequencyLimits{5, 2, 0};
    engine_->configureSystem(config);

    size_t accepted = 0;
    size_t limited = 0;
    for (int i = 0; i < 3; ++i) {
        DetectionResult result =
            engine_->detect("pv-001", makeRecord("pv-001", t0_ + i * utils::MS_PER_HOUR));
        accepted += result.anomalies.size();
        limited += result.rate_limited;
    }

    EXPECT_EQ(accepted, 2u);
    EXPECT_EQ(limited, 1u);
    EXPECT_EQ(engine_->getStats()["anomalies_rate_limited"], 1);
    EXPECT_EQ(engine_->listAnomalies("pv-001").size(), 2u);
}

TEST_F(DetectionEngineTest, CooldownSuppressesRepeats) {
    DetectionConfig config = makeConfig("pv-001");
    config.frequency = FrequencyLimits{5, 20, 15};
    engine_->configureSystem(config);

    EXPECT_EQ(engine_->detect("pv-001", makeRecord("pv-001", t0_)).anomalies.size(), 1u);
    DetectionResult repeat =
        engine_->detect("pv-001", makeRecord("pv-001", t0_ + 5 * utils::MS_PER_MINUTE));
    EXPECT_TRUE(repeat.anomalies.empty());
    EXPECT_EQ(repeat.rate_limited, 1u);
}

TEST_F(DetectionEngineTest, LifecycleThroughEngine) {
    engine_->configureSystem(makeConfig("pv-001"));
    std::string id = engine_->detect("pv-001", makeRecord("pv-001", t0_)).anomalies.at(0).id;

    AnomalyFeedback feedback;
    feedback.correct = true;
    Anomaly acked = engine_->acknowledge(id, "operator-7", feedback);
    EXPECT_EQ(acked.status, AnomalyStatus::INVESTIGATING);
    EXPECT_EQ(acked.acknowledged_by, "operator-7");
    EXPECT_GT(acked.acknowledged_at, 0);
    EXPECT_EQ(listener_->acknowledged, 1u);

    try {
        engine_->acknowledge(id, "operator-8");
        FAIL() << "second acknowledgement accepted";
    } catch (const InvalidStateTransitionError& e) {
        EXPECT_EQ(e.reason(), InvalidStateTransitionError::Reason::CONFLICT);
    }

    Anomaly resolved = engine_->setStatus(id, AnomalyStatus::RESOLVED);
    EXPECT_EQ(resolved.status, AnomalyStatus::RESOLVED);
    EXPECT_GT(resolved.closed_at, 0);
    EXPECT_EQ(listener_->last_previous, AnomalyStatus::INVESTIGATING);
    EXPECT_EQ(listener_->last_status, AnomalyStatus::RESOLVED);

    EXPECT_THROW(engine_->setStatus(id, AnomalyStatus::FALSE_POSITIVE),
                 InvalidStateTransitionError);

    try {
        engine_->setStatus("anomaly_missing", AnomalyStatus::RESOLVED);
        FAIL() << "unknown anomaly accepted";
    } catch (const InvalidStateTransitionError& e) {
        EXPECT_EQ(e.reason(), InvalidStateTransitionError::Reason::NOT_FOUND);
    }

    AnomalyStatistics stats = engine_->getStatistics("pv-001");
    EXPECT_EQ(stats.total, 1u);
    EXPECT_EQ(stats.reviewed, 1u);
    EXPECT_DOUBLE_EQ(stats.accuracy, 1.0);
}

TEST_F(DetectionEngineTest, ListenerFailureDoesNotFailDetection) {
    listener_->throw_on_detect = true;
    engine_->configureSystem(makeConfig("pv-001"));

    DetectionResult result = engine_->detect("pv-001", makeRecord("pv-001", t0_));
    EXPECT_EQ(result.status, DetectionStatus::COMPLETED);
    EXPECT_EQ(result.anomalies.size(), 1u);
    EXPECT_EQ(engine_->listAnomalies("pv-001").size(), 1u);
}

TEST_F(DetectionEngineTest, ReconfigureKeepsHistory) {
    engine_->configureSystem(makeConfig("pv-001"));
    engine_->detect("pv-001", makeRecord("pv-001", t0_));

    DetectionConfig updated = makeConfig("pv-001", {"test_fixed", "test_throwing"});
    engine_->configureSystem(updated);
    EXPECT_EQ(engine_->listAnomalies("pv-001").size(), 1u);
    auto config = engine_->getConfig("pv-001");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->methods.size(), 2u);
}

TEST_F(DetectionEngineTest, RemoveSystemForgetsAnomalies) {
    engine_->configureSystem(makeConfig("pv-001"));
    std::string id = engine_->detect("pv-001", makeRecord("pv-001", t0_)).anomalies.at(0).id;

    EXPECT_TRUE(engine_->removeSystem("pv-001"));
    EXPECT_FALSE(engine_->removeSystem("pv-001"));
    EXPECT_FALSE(engine_->getAnomaly(id).has_value());
    EXPECT_TRUE(engine_->listAnomalies("pv-001").empty());
    EXPECT_THROW(engine_->acknowledge(id, "op"), InvalidStateTransitionError);
}

TEST_F(DetectionEngineTest, ConcurrentSystems) {
    const int systems = 4;
    const int records = 20;
    for (int s = 0; s < systems; ++s) {
        engine_->configureSystem(makeConfig("pv-" + std::to_string(s)));
    }

    std::vector<std::thread> threads;
    for (int s = 0; s < systems; ++s) {
        threads.emplace_back([this, s]() {
            std::string id = "pv-" + std::to_string(s);
            for (int i = 0; i < records; ++i) {
                engine_->detect(id, makeRecord(id, t0_ + i * utils::MS_PER_HOUR));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    AnomalyStatistics all = engine_->getStatistics();
    EXPECT_EQ(all.total, static_cast<size_t>(systems * records));
    EXPECT_EQ(engine_->getStats()["records_processed"], systems * records);
    EXPECT_EQ(engine_->listSystems().size(), static_cast<size_t>(systems));
}

TEST_F(DetectionEngineTest, RefreshBaseline) {
    engine_->configureSystem(makeConfig("pv-001", {"test_baseline"}));
    int64_t now = t0_ + 40 * utils::MS_PER_HOUR;

    EXPECT_THROW(engine_->refreshBaseline("pv-404", now), std::out_of_range);
    EXPECT_THROW(engine_->refreshBaseline("pv-001", now), InsufficientDataError);

    for (int i = 0; i < 30; ++i) {
        store_->add(makeRecord("pv-001", t0_ + i * utils::MS_PER_HOUR));
    }
    auto baseline = engine_->refreshBaseline("pv-001", now);
    ASSERT_NE(baseline, nullptr);
    EXPECT_EQ(baseline->sample_count, 30u);
    EXPECT_EQ(baseline->built_at, now);
}

TEST_F(DetectionEngineTest, HistoryFailureKeepsBaselineFreeChecks) {
    for (bool typed : {false, true}) {
        DetectionEngine engine(std::make_shared<FailingHistory>(typed), nullptr, maintenance_);
        DetectionConfig config = DetectionConfig::defaults("pv-001");
        config.exclusions.clear();
        engine.configureSystem(config);

        TelemetryRecord record = makeRecord("pv-001", t0_);
        record.production.frequency = 45.0;
        DetectionResult result = engine.detect("pv-001", record);

        EXPECT_EQ(result.status, DetectionStatus::COMPLETED) << result.message;
        EXPECT_TRUE(result.insufficient_data);
        auto baseline_error = std::find_if(result.method_errors.begin(), result.method_errors.end(),
                                           [](const MethodError& e) { return e.method == "baseline"; });
        ASSERT_NE(baseline_error, result.method_errors.end());
        EXPECT_NE(baseline_error->message.find(typed ? "503" : "connection reset by peer"),
                  std::string::npos);
        EXPECT_FALSE(result.skipped_methods.empty());

        bool has_fault = std::any_of(result.anomalies.begin(), result.anomalies.end(),
                                     [](const Anomaly& a) {
                                         return a.type == AnomalyType::EQUIPMENT_MALFUNCTION;
                                     });
        EXPECT_TRUE(has_fault);
    }
}

TEST_F(DetectionEngineTest, ShortHistoryFetchedOncePerRetryInterval) {
    auto history = std::make_shared<CountingHistory>();
    DetectionEngine engine(history, nullptr, maintenance_);
    engine.configureSystem(makeConfig("pv-001", {"test_baseline", "test_fixed"}));

    for (int i = 0; i < 5; ++i) {
        DetectionResult result = engine.detect(
            "pv-001", makeRecord("pv-001", t0_ + i * 10 * utils::MS_PER_MINUTE));
        EXPECT_TRUE(result.insufficient_data);
        EXPECT_EQ(result.status, DetectionStatus::COMPLETED);
    }
    EXPECT_EQ(history->fetches.load(), 1u);

    // refreshBaseline bypasses the remembered result
    EXPECT_THROW(engine.refreshBaseline("pv-001", t0_ + utils::MS_PER_HOUR / 2),
                 InsufficientDataError);
    EXPECT_EQ(history->fetches.load(), 2u);
}

TEST_F(DetectionEngineTest, ConcurrentDetectionBuildsBaselineOnce) {
    engine_->configureSystem(makeConfig("pv-001", {"test_baseline"}));
    for (int i = 0; i < 30; ++i) {
        store_->add(makeRecord("pv-001", t0_ + i * utils::MS_PER_HOUR));
    }

    int64_t ts = t0_ + 31 * utils::MS_PER_HOUR;
    std::vector<std::thread> threads;
    std::atomic<int> with_baseline{0};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t]() {
            DetectionResult result = engine_->detect(
                "pv-001", makeRecord("pv-001", ts + t * utils::MS_PER_MINUTE));
            if (!result.insufficient_data && result.skipped_methods.empty()) {
                with_baseline++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(with_baseline.load(), 8);
    EXPECT_EQ(engine_->baselineBuildCount("pv-001"), 1u);

    engine_->refreshBaseline("pv-001", ts + utils::MS_PER_HOUR);
    EXPECT_EQ(engine_->baselineBuildCount("pv-001"), 2u);
}

TEST_F(DetectionEngineTest, RemoveDuringDetectLeavesNoOwnerEntries) {
    DetectorFactory::instance().register_detector("test_gated", [](const ConfigMap& c) {
        return std::make_shared<GatedDetector>(c);
    });
    GatedDetector::entered = false;
    GatedDetector::released = false;
    engine_->configureSystem(makeConfig("pv-001", {"test_gated"}));

    DetectionResult result;
    std::thread worker([&]() {
        result = engine_->detect("pv-001", makeRecord("pv-001", t0_));
    });
    while (!GatedDetector::entered) {
        std::this_thread::yield();
    }
    EXPECT_TRUE(engine_->removeSystem("pv-001"));
    GatedDetector::released = true;
    worker.join();

    ASSERT_EQ(result.anomalies.size(), 1u);
    EXPECT_EQ(engine_->getStats()["tracked_anomalies"], 0);
    EXPECT_FALSE(engine_->getAnomaly(result.anomalies[0].id).has_value());
    EXPECT_FALSE(engine_->hasSystem("pv-001"));
}

TEST_F(DetectionEngineTest, OptionsFromConfigMap) {
    EngineOptions options = EngineOptions::fromConfigMap({
        {"history_capacity", "50"},
        {"weather_match_minutes", "10"},
        {"baseline_retry_minutes", "15"}
    });
    EXPECT_EQ(options.baseline_retry_minutes, 15);
    EXPECT_EQ(options.history_capacity, 50u);
    EXPECT_EQ(options.weather_match_minutes, 10);
    EXPECT_EQ(options.recent_records, 100u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
