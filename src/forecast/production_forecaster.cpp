#include "pv_watch/forecast/production_forecaster.h"
#include "pv_watch/algorithms/statistics.h"
#include "pv_watch/core/errors.h"
#include "pv_watch/forecast/moving_average.h"
#include "pv_watch/utils/time_utils.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace pv_watch {
namespace forecast {

namespace {

using HourlyMeans = std::array<std::optional<double>, 24>;

HourlyMeans hourlyMeans(const std::vector<TelemetryRecord>& history) {
    std::array<double, 24> sums{};
    std::array<size_t, 24> counts{};
    for (const auto& record : history) {
        int hour = utils::hourOfDay(record.timestamp);
        sums[hour] += record.production.energy_delta;
        counts[hour]++;
    }

    HourlyMeans means;
    for (int h = 0; h < 24; ++h) {
        if (counts[h] > 0) {
            means[h] = sums[h] / counts[h];
        }
    }
    return means;
}

// Mean forecast irradiance of the samples in [start, end)
std::optional<double> meanIrradiance(const std::vector<WeatherSample>& weather,
                                     int64_t start, int64_t end) {
    double sum = 0.0;
    size_t count = 0;
    for (const auto& sample : weather) {
        if (sample.timestamp >= start && sample.timestamp < end) {
            sum += sample.ghi;
            count++;
        }
    }
    if (count == 0) {
        return std::nullopt;
    }
    return sum / count;
}

// Mean daylight irradiance of the history, 0 when nothing was measured
double historicalIrradiance(const std::vector<TelemetryRecord>& history) {
    std::vector<double> values;
    for (const auto& record : history) {
        if (record.environmental.irradiance && *record.environmental.irradiance > 0.0) {
            values.push_back(*record.environmental.irradiance);
        }
    }
    return stats::mean(values);
}

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

std::string formatNumber(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

ForecastFactor weatherFactor(size_t covered, const std::string& unit) {
    return ForecastFactor{"Weather Forecast", 0.8, 0.9,
                          "Forecast irradiance applied to " + std::to_string(covered) + " " + unit};
}

} // namespace

ForecastRange buildRange(double value, double std_dev, double confidence) {
    double margin = std_dev * (1.0 - confidence);

    ForecastRange range;
    range.min = std::max(0.0, value - 2.0 * margin);
    range.p10 = std::max(0.0, value - 1.3 * margin);
    range.p50 = value;
    range.p90 = value + 1.3 * margin;
    range.max = value + 2.0 * margin;
    return range;
}

double clearSkyFactor(int hour) {
    if (hour < 6 || hour > 18) {
        return 0.0;
    }
    double offset = std::abs(hour - 12) / 6.0;
    return std::max(0.0, 1.0 - offset * offset);
}

int validForMinutes(ForecastHorizon horizon) {
    switch (horizon) {
        case ForecastHorizon::HOUR:  return 15;
        case ForecastHorizon::DAY:   return 240;
        case ForecastHorizon::WEEK:  return 1440;
        case ForecastHorizon::MONTH: return 10080;
    }
    return 15;
}

ProductionForecaster::ProductionForecaster(const ConfigMap& config)
    : config_(config) {
    minimum_history_ = utils::getConfigValue<size_t>(config_, "minimum_history_records", 10);
    default_irradiance_ = utils::getConfigValue<double>(config_, "default_irradiance", 500.0);
    reference_irradiance_ = utils::getConfigValue<double>(config_, "reference_irradiance", 500.0);
    moving_average_window_ = utils::getConfigValue<size_t>(config_, "moving_average_window", 7);
    weather_match_ms_ = utils::getConfigValue<int64_t>(config_, "weather_match_minutes", 60) *
                        utils::MS_PER_MINUTE;

    if (minimum_history_ == 0) {
        throw InvalidInputError("minimum_history_records must be positive");
    }
    if (reference_irradiance_ <= 0.0) {
        throw InvalidInputError("reference_irradiance must be positive");
    }
}

double ProductionForecaster::baseConfidence(ForecastHorizon horizon) const {
    switch (horizon) {
        case ForecastHorizon::HOUR:
            return utils::getConfigValue<double>(config_, "confidence.hour", 0.85);
        case ForecastHorizon::DAY:
            return utils::getConfigValue<double>(config_, "confidence.day", 0.75);
        case ForecastHorizon::WEEK:
            return utils::getConfigValue<double>(config_, "confidence.week", 0.65);
        case ForecastHorizon::MONTH:
            return utils::getConfigValue<double>(config_, "confidence.month", 0.55);
    }
    return 0.5;
}

std::shared_ptr<ProductionForecaster::Entry> ProductionForecaster::entry(const std::string& system_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = entries_[system_id];
    if (!slot) {
        slot = std::make_shared<Entry>();
    }
    return slot;
}

ProductionForecaster::DailyTotals ProductionForecaster::dailyTotals(
        const std::vector<TelemetryRecord>& history) {
    std::map<int64_t, double> by_day;
    for (const auto& record : history) {
        by_day[utils::startOfDay(record.timestamp)] += record.production.energy_delta;
    }

    DailyTotals daily;
    for (const auto& kv : by_day) {
        daily.days.push_back(kv.first);
        daily.totals.push_back(kv.second);
    }
    return daily;
}

ProductionForecaster::Models ProductionForecaster::ensureModels(
        const std::string& system_id,
        const std::vector<TelemetryRecord>& history,
        const DailyTotals& daily) {
    Fingerprint fingerprint{history.size(), history.front().timestamp, history.back().timestamp};

    std::shared_ptr<Entry> e = entry(system_id);
    std::lock_guard<std::mutex> train_lock(e->train_mutex);
    if (e->models.regression && e->fingerprint == fingerprint) {
        return e->models;
    }

    std::vector<double> x;
    std::vector<double> y;
    x.reserve(history.size());
    y.reserve(history.size());
    for (const auto& record : history) {
        x.push_back(record.environmental.irradiance.value_or(default_irradiance_));
        y.push_back(record.production.energy_delta);
    }

    auto regression = std::make_shared<LinearRegression>();
    regression->train(x, y);

    std::shared_ptr<SeasonalModel> seasonal;
    if (daily.totals.size() >= SeasonalModel::MIN_SAMPLES) {
        seasonal = std::make_shared<SeasonalModel>();
        seasonal->train(daily.days, daily.totals);
    }

    e->models.regression = regression;
    e->models.seasonal = seasonal;
    e->fingerprint = fingerprint;
    e->trains++;

    std::cout << "[ProductionForecaster] Trained models for " << system_id
              << " from " << history.size() << " records (R²="
              << formatNumber(regression->rSquared(), 3)
              << (seasonal ? ", seasonal" : "") << ")" << std::endl;
    return e->models;
}

ForecastResult ProductionForecaster::predict(const std::string& system_id,
                                             ForecastHorizon horizon,
                                             const std::vector<TelemetryRecord>& history,
                                             const std::vector<WeatherSample>& weather,
                                             std::optional<int64_t> as_of) {
    if (history.size() < minimum_history_) {
        throw InsufficientDataError("Forecast for '" + system_id + "' needs at least " +
                                    std::to_string(minimum_history_) + " records, got " +
                                    std::to_string(history.size()),
                                    history.size(), minimum_history_);
    }

    for (const auto& record : history) {
        validateRecord(record, system_id);
    }

    std::vector<TelemetryRecord> sorted = history;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const TelemetryRecord& a, const TelemetryRecord& b) {
                         return a.timestamp < b.timestamp;
                     });

    int64_t start = as_of.value_or(sorted.back().timestamp);
    DailyTotals daily = dailyTotals(sorted);
    Models models = ensureModels(system_id, sorted, daily);

    ForecastResult result;
    switch (horizon) {
        case ForecastHorizon::HOUR:
            result = predictHour(sorted, weather, models, start);
            break;
        case ForecastHorizon::DAY:
            result = predictDay(sorted, weather, start);
            break;
        case ForecastHorizon::WEEK:
        case ForecastHorizon::MONTH:
            result = predictMultiDay(horizon, sorted, weather, daily, models, start);
            break;
    }

    std::vector<double> energy;
    energy.reserve(sorted.size());
    for (const auto& record : sorted) {
        energy.push_back(record.production.energy_delta);
    }

    result.value = std::max(0.0, result.value);
    result.confidence = std::min(std::max(result.confidence, 0.0), 1.0);
    result.range = buildRange(result.value, stats::stdDev(energy), result.confidence);
    result.generated_at = utils::nowMs();
    result.target_time = start;
    result.valid_for_minutes = validForMinutes(horizon);
    return result;
}

ForecastResult ProductionForecaster::predictHour(const std::vector<TelemetryRecord>& history,
                                                 const std::vector<WeatherSample>& weather,
                                                 const Models& models, int64_t as_of) const {
    ForecastResult result;
    result.confidence = baseConfidence(ForecastHorizon::HOUR);
    result.factors.push_back({"Historical Pattern", 0.6, 0.8,
                              "Average production at this hour of day"});
    result.factors.push_back({"Seasonal Variation", 0.2, 0.7,
                              "Time of year adjustment"});

    const WeatherSample* sample = findClosestWeather(weather, as_of, weather_match_ms_);
    if (sample) {
        result.value = models.regression->predict(sample->ghi);
        result.methodology = "Linear regression with weather correlation and historical patterns";
        result.factors.push_back({"Weather Forecast", 0.8, 0.9,
                                  formatNumber(sample->ghi, 0) + " W/m² forecast irradiance"});
        return result;
    }

    HourlyMeans means = hourlyMeans(history);
    result.value = means[utils::hourOfDay(as_of)].value_or(0.0);
    result.methodology = "Historical hourly pattern";
    return result;
}

ForecastResult ProductionForecaster::predictDay(const std::vector<TelemetryRecord>& history,
                                                const std::vector<WeatherSample>& weather,
                                                int64_t as_of) const {
    HourlyMeans means = hourlyMeans(history);

    double total = 0.0;
    size_t covered = 0;
    for (int i = 0; i < 24; ++i) {
        int64_t hour_start = as_of + i * utils::MS_PER_HOUR;
        double estimate = means[utils::hourOfDay(hour_start)].value_or(0.0);

        auto forecast = meanIrradiance(weather, hour_start, hour_start + utils::MS_PER_HOUR);
        if (forecast) {
            estimate *= *forecast / reference_irradiance_;
            covered++;
        }
        total += estimate;
    }

    ForecastResult result;
    result.value = total;
    result.confidence = baseConfidence(ForecastHorizon::DAY);
    result.methodology = "Hourly aggregation with seasonal adjustments";
    result.factors.push_back({"Historical Daily Patterns", 0.7, 0.8,
                              "Sum of hourly production averages"});
    result.factors.push_back({"System Performance Trend", 0.3, 0.6,
                              "Recent system performance"});
    if (covered > 0) {
        result.factors.push_back(weatherFactor(covered, "hours"));
    }
    return result;
}

ForecastResult ProductionForecaster::predictMultiDay(ForecastHorizon horizon,
                                                     const std::vector<TelemetryRecord>& history,
                                                     const std::vector<WeatherSample>& weather,
                                                     const DailyTotals& daily,
                                                     const Models& models,
                                                     int64_t as_of) const {
    MovingAverage average(moving_average_window_);
    for (double total : daily.totals) {
        average.add(total);
    }
    double daily_average = average.predict();

    bool month = horizon == ForecastHorizon::MONTH;
    int days = month ? utils::daysInMonth(as_of) : 7;
    bool use_seasonal = month && models.seasonal != nullptr;
    double reference = historicalIrradiance(history);

    double total = 0.0;
    size_t covered = 0;
    for (int d = 0; d < days; ++d) {
        int64_t day_start = as_of + d * utils::MS_PER_DAY;
        double estimate = use_seasonal ? models.seasonal->predict(day_start) : daily_average;

        auto forecast = meanIrradiance(weather, day_start, day_start + utils::MS_PER_DAY);
        if (forecast && reference > 0.0) {
            estimate *= *forecast / reference;
            covered++;
        }
        total += estimate;
    }

    ForecastResult result;
    result.value = total;
    result.confidence = baseConfidence(horizon);

    if (month) {
        result.methodology = "Long-term trend analysis with seasonal patterns";
        result.factors.push_back({"Seasonal Cycle", 0.9, 0.8,
                                  use_seasonal ? "Day-of-year seasonal factors"
                                               : "Average of recent daily totals"});
        result.factors.push_back({"System Degradation", 0.2, 0.7,
                                  "Long-term performance trend"});
    } else {
        result.methodology = "Seasonal decomposition with trend analysis";
        result.factors.push_back({"Seasonal Patterns", 0.8, 0.7,
                                  "Weekly production pattern"});
        result.factors.push_back({"Historical Averages", 0.6, 0.8,
                                  formatNumber(daily_average, 2) + " kWh average daily total"});
    }

    if (covered > 0) {
        double scale = month
            ? utils::getConfigValue<double>(config_, "weather_confidence.month", 0.8)
            : utils::getConfigValue<double>(config_, "weather_confidence.week", 0.9);
        result.confidence *= scale;
        result.factors.push_back(weatherFactor(covered, "days"));
    }
    return result;
}

std::vector<ForecastResult> ProductionForecaster::predictWeatherImpact(
        const SystemProfile& profile,
        const std::vector<WeatherSample>& weather) const {
    std::vector<ForecastResult> results;
    results.reserve(weather.size());

    for (const auto& sample : weather) {
        double base = profile.capacity_kw * clearSkyFactor(utils::hourOfDay(sample.timestamp)) * 0.8;

        double irradiance_impact = sample.ghi / 1000.0;
        double temperature_impact = 1.0 - 0.004 * (sample.temperature - 25.0);
        double cloud_impact = 1.0 - sample.cloud_cover * 0.7;
        double wind_impact = std::min(1.0 + sample.wind_speed * 0.01, 1.05);
        double precipitation_impact = sample.precipitation > 0.0 ? 0.8 : 1.0;

        double value = std::max(0.0, base * irradiance_impact * temperature_impact *
                                     cloud_impact * wind_impact * precipitation_impact);

        ForecastResult result;
        result.value = value;
        result.confidence = 0.8;
        double margin = value * 0.2;
        result.range.min = std::max(0.0, value - margin);
        result.range.p10 = std::max(0.0, value - 0.6 * margin);
        result.range.p50 = value;
        result.range.p90 = value + 0.6 * margin;
        result.range.max = value + margin;
        result.factors.push_back({"Solar Irradiance", (irradiance_impact - 1.0) * 100.0, 0.95,
                                  formatNumber(sample.ghi, 0) + " W/m² expected"});
        result.factors.push_back({"Temperature", (temperature_impact - 1.0) * 100.0, 0.85,
                                  formatNumber(sample.temperature, 1) + "°C ambient temperature"});
        result.factors.push_back({"Cloud Cover", (cloud_impact - 1.0) * 100.0, 0.75,
                                  formatNumber(sample.cloud_cover * 100.0, 0) + "% cloud cover"});
        result.methodology = "weather_correlation_model";
        result.generated_at = utils::nowMs();
        result.target_time = sample.timestamp;
        result.valid_for_minutes = 60;
        results.push_back(std::move(result));
    }
    return results;
}

DegradationForecast ProductionForecaster::predictDegradation(
        const std::string& system_id,
        const std::vector<TelemetryRecord>& history,
        const SystemProfile& profile,
        std::optional<int64_t> as_of) const {
    if (history.empty()) {
        throw InsufficientDataError("Degradation forecast for '" + system_id +
                                    "' needs history", 0, 1);
    }

    double rate = utils::getConfigValue<double>(config_, "degradation_rate", 0.5);
    int years = utils::getConfigValue<int>(config_, "projection_years", 25);
    size_t recent_count = utils::getConfigValue<size_t>(config_, "degradation_recent_records", 30);

    std::vector<TelemetryRecord> sorted = history;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const TelemetryRecord& a, const TelemetryRecord& b) {
                         return a.timestamp < b.timestamp;
                     });

    size_t first = sorted.size() > recent_count ? sorted.size() - recent_count : 0;
    std::vector<double> recent_pr;
    for (size_t i = first; i < sorted.size(); ++i) {
        recent_pr.push_back(sorted[i].performance.performance_ratio);
    }
    std::vector<double> quality;
    for (const auto& record : sorted) {
        quality.push_back(record.quality_confidence);
    }

    DegradationForecast forecast;
    forecast.system_id = system_id;
    forecast.degradation_rate = rate;
    forecast.current_degradation = round2(std::max(profile.system_age_years * rate,
                                                   (1.0 - stats::mean(recent_pr)) * 100.0));

    int base_year = utils::toCalendar(as_of.value_or(sorted.back().timestamp)).year;
    double annual = profile.annualTarget();
    for (int i = 1; i <= years; ++i) {
        double percent = forecast.current_degradation + rate * i;
        DegradationProjection projection;
        projection.year = base_year + i;
        projection.degradation_percent = round2(percent);
        projection.production_loss = round2(annual * percent / 100.0);
        projection.lower = round2(std::max(0.0, percent - 0.5));
        projection.upper = round2(percent + 0.5);
        forecast.projections.push_back(projection);
    }

    forecast.factors.push_back({"Panel Technology", 1.0, "Standard crystalline silicon degradation"});
    forecast.factors.push_back({"Environmental Conditions", 1.2, "Local climate stress"});
    if (profile.system_age_years > 10.0) {
        forecast.factors.push_back({"System Age", 1.3, "Accelerated degradation after 10 years"});
    } else {
        forecast.factors.push_back({"System Age", 1.0, "System within its early service life"});
    }

    forecast.confidence = std::min(0.95, profile.system_age_years / 5.0 * 0.3 +
                                         stats::mean(quality) * 0.7);
    return forecast;
}

std::shared_ptr<const LinearRegression> ProductionForecaster::model(const std::string& system_id) const {
    std::shared_ptr<Entry> e;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(system_id);
        if (it == entries_.end()) {
            return nullptr;
        }
        e = it->second;
    }
    std::lock_guard<std::mutex> train_lock(e->train_mutex);
    return e->models.regression;
}

size_t ProductionForecaster::trainCount(const std::string& system_id) const {
    std::shared_ptr<Entry> e;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(system_id);
        if (it == entries_.end()) {
            return 0;
        }
        e = it->second;
    }
    std::lock_guard<std::mutex> train_lock(e->train_mutex);
    return e->trains;
}

void ProductionForecaster::invalidate(const std::string& system_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(system_id);
}

} // namespace forecast
} // namespace pv_watch
