#include "pv_watch/detection/detection_method.h"
#include "pv_watch/detection/comparative_detector.h"
#include "pv_watch/detection/pattern_detector.h"
#include "pv_watch/detection/physics_detector.h"
#include "pv_watch/detection/seasonal_detector.h"
#include "pv_watch/detection/statistical_outlier_detector.h"
#include "pv_watch/detection/threshold_detector.h"
#include "pv_watch/detection/trend_detector.h"
#include "pv_watch/utils/time_utils.h"
#include <algorithm>

namespace pv_watch {
namespace detection {

AnomalyCandidate DetectionMethod::makeCandidate(const DetectionContext& context,
                                                AnomalyType type,
                                                AnomalyCategory category) const {
    const TelemetryRecord& record = context.record;

    AnomalyCandidate candidate;
    candidate.type = type;
    candidate.category = category;
    candidate.timestamp = record.timestamp;
    candidate.detected_by.push_back(name());

    utils::CalendarDate date = utils::toCalendar(record.timestamp);
    candidate.context.seasonal.hour_of_day = date.hour;
    candidate.context.seasonal.day_of_week = date.day_of_week;
    candidate.context.seasonal.day_of_year = date.day_of_year;

    if (context.baseline) {
        const auto& pr = context.baseline->statistics;
        candidate.context.historical_range = HistoricalRange{pr.min, pr.max, pr.mean, pr.std_dev};

        const auto& hourly = context.baseline->hour(date.hour);
        if (hourly) {
            candidate.context.seasonal.seasonal_expected = hourly->mean;
            candidate.context.seasonal.seasonal_std_dev = hourly->std_dev;
        }
    }

    if (context.weather) {
        int64_t match_ms = utils::getConfigValue<int64_t>(config_, "weather_match_minutes", 30) *
                           utils::MS_PER_MINUTE;
        const WeatherSample* sample = findClosestWeather(*context.weather, record.timestamp, match_ms);
        if (sample) {
            WeatherSnapshot snapshot;
            snapshot.irradiance = sample->ghi;
            snapshot.temperature = sample->temperature;
            snapshot.cloud_cover = sample->cloud_cover;
            snapshot.precipitation = sample->precipitation;
            candidate.context.weather = snapshot;
        }
    }

    return candidate;
}

double tieredScore(double deviation, double medium_boundary,
                   double critical_boundary, double saturation) {
    double score;
    if (deviation >= critical_boundary) {
        double span = saturation - critical_boundary;
        double excess = span > 0.0 ? (deviation - critical_boundary) / span : 1.0;
        score = 0.8 + 0.2 * std::min(excess, 1.0);
    } else if (deviation >= medium_boundary) {
        score = 0.6 + 0.2 * (deviation - medium_boundary) / (critical_boundary - medium_boundary);
    } else {
        score = medium_boundary > 0.0 ? 0.6 * deviation / medium_boundary : 0.0;
    }
    return std::clamp(score, 0.0, 1.0);
}

double sensitivityFactor(const ConfigMap& config) {
    std::string sensitivity = utils::getConfigValue<std::string>(config, "sensitivity", "medium");
    if (sensitivity == "high") {
        return 0.8;
    }
    if (sensitivity == "low") {
        return 1.2;
    }
    return 1.0;
}

// ========== DetectorFactory ==========

DetectorFactory& DetectorFactory::instance() {
    static DetectorFactory factory;
    return factory;
}

DetectorFactory::DetectorFactory() {
    // Built-in methods
    creators_["statistical_outlier"] = [](const ConfigMap& config) {
        return std::make_shared<StatisticalOutlierDetector>(config);
    };
    creators_["threshold_analysis"] = [](const ConfigMap& config) {
        return std::make_shared<ThresholdDetector>(config);
    };
    creators_["trend_analysis"] = [](const ConfigMap& config) {
        return std::make_shared<TrendDetector>(config);
    };
    creators_["comparative_analysis"] = [](const ConfigMap& config) {
        return std::make_shared<ComparativeDetector>(config);
    };
    creators_["physics_based"] = [](const ConfigMap& config) {
        return std::make_shared<PhysicsDetector>(config);
    };
    creators_["seasonal_anomaly"] = [](const ConfigMap& config) {
        return std::make_shared<SeasonalDetector>(config);
    };
    creators_["pattern_recognition"] = [](const ConfigMap& config) {
        return std::make_shared<PatternRecognitionDetector>(config);
    };
}

void DetectorFactory::register_detector(const std::string& name, Creator creator) {
    std::lock_guard<std::mutex> lock(mutex_);
    creators_[name] = std::move(creator);
}

std::shared_ptr<DetectionMethod> DetectorFactory::create(const std::string& name,
                                                         const ConfigMap& config) const {
    Creator creator;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = creators_.find(name);
        if (it == creators_.end()) {
            return nullptr;
        }
        creator = it->second;
    }
    return creator(config);
}

bool DetectorFactory::has_detector(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return creators_.count(name) > 0;
}

std::vector<std::string> DetectorFactory::list_detectors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& pair : creators_) {
        names.push_back(pair.first);
    }
    return names;
}

} // namespace detection
} // namespace pv_watch
