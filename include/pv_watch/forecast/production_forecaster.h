#pragma once

#include "pv_watch/core/system_profile.h"
#include "pv_watch/core/telemetry_record.h"
#include "pv_watch/forecast/forecast_types.h"
#include "pv_watch/forecast/linear_regression.h"
#include "pv_watch/forecast/seasonal_model.h"
#include "pv_watch/utils/config.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pv_watch {
namespace forecast {

/**
 * @brief Energy production forecasts per system
 *
 * Trains an irradiance -> energy regression (and, with a year of daily
 * totals, a seasonal model) per system. Models are cached and retrained only
 * when the history changes; concurrent training for one system is
 * single-flight.
 *
 * Configuration keys:
 * - minimum_history_records (10)
 * - default_irradiance (500): regression input for records without irradiance
 * - reference_irradiance (500): irradiance that leaves hourly means unscaled
 * - moving_average_window (7)
 * - weather_match_minutes (60): hour horizon weather lookup distance
 * - confidence.hour / .day / .week / .month (0.85 / 0.75 / 0.65 / 0.55)
 * - weather_confidence.week / .month (0.9 / 0.8)
 * - degradation_rate (0.5 % per year), projection_years (25),
 *   degradation_recent_records (30)
 */
class ProductionForecaster {
public:
    explicit ProductionForecaster(const ConfigMap& config = {});

    ProductionForecaster(const ProductionForecaster&) = delete;
    ProductionForecaster& operator=(const ProductionForecaster&) = delete;

    /**
     * @brief Forecast production over a horizon
     * @param system_id System to forecast
     * @param horizon Period length
     * @param history Historical records of the system (any order)
     * @param weather Optional weather forecast samples
     * @param as_of Start of the forecast period, defaults to the last record
     * @return Forecast with value >= 0 and an ordered range
     * @throw InsufficientDataError with fewer than minimum_history_records
     * @throw InvalidInputError when a record fails validation
     */
    ForecastResult predict(const std::string& system_id,
                           ForecastHorizon horizon,
                           const std::vector<TelemetryRecord>& history,
                           const std::vector<WeatherSample>& weather = {},
                           std::optional<int64_t> as_of = std::nullopt);

    /**
     * @brief Expected output under each forecast weather sample
     *
     * No history needed: a clear-sky bell curve scaled by the sample.
     */
    std::vector<ForecastResult> predictWeatherImpact(const SystemProfile& profile,
                                                     const std::vector<WeatherSample>& weather) const;

    /**
     * @brief Yearly degradation projection
     * @throw InsufficientDataError on empty history
     */
    DegradationForecast predictDegradation(const std::string& system_id,
                                           const std::vector<TelemetryRecord>& history,
                                           const SystemProfile& profile,
                                           std::optional<int64_t> as_of = std::nullopt) const;

    /**
     * @brief Cached regression of a system, nullptr before the first forecast
     */
    std::shared_ptr<const LinearRegression> model(const std::string& system_id) const;

    /**
     * @brief Number of training runs for a system
     */
    size_t trainCount(const std::string& system_id) const;

    void invalidate(const std::string& system_id);

    const ConfigMap& get_config() const { return config_; }

private:
    struct Fingerprint {
        size_t size = 0;
        int64_t first = 0;
        int64_t last = 0;

        bool operator==(const Fingerprint& other) const {
            return size == other.size && first == other.first && last == other.last;
        }
    };

    struct Models {
        std::shared_ptr<const LinearRegression> regression;
        std::shared_ptr<const SeasonalModel> seasonal;   // nullptr below a year of days
    };

    struct Entry {
        std::mutex train_mutex;
        Fingerprint fingerprint;
        Models models;
        size_t trains = 0;
    };

    struct DailyTotals {
        std::vector<int64_t> days;
        std::vector<double> totals;
    };

    std::shared_ptr<Entry> entry(const std::string& system_id);

    Models ensureModels(const std::string& system_id,
                        const std::vector<TelemetryRecord>& history,
                        const DailyTotals& daily);

    static DailyTotals dailyTotals(const std::vector<TelemetryRecord>& history);

    ForecastResult predictHour(const std::vector<TelemetryRecord>& history,
                               const std::vector<WeatherSample>& weather,
                               const Models& models, int64_t as_of) const;

    ForecastResult predictDay(const std::vector<TelemetryRecord>& history,
                              const std::vector<WeatherSample>& weather,
                              int64_t as_of) const;

    ForecastResult predictMultiDay(ForecastHorizon horizon,
                                   const std::vector<TelemetryRecord>& history,
                                   const std::vector<WeatherSample>& weather,
                                   const DailyTotals& daily,
                                   const Models& models, int64_t as_of) const;

    double baseConfidence(ForecastHorizon horizon) const;

    ConfigMap config_;
    size_t minimum_history_;
    double default_irradiance_;
    double reference_irradiance_;
    size_t moving_average_window_;
    int64_t weather_match_ms_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
};

/**
 * @brief Range around a prediction: margin = std_dev * (1 - confidence),
 *        min/max at 2 margins, p10/p90 at 1.3 margins, low end clamped at 0
 */
ForecastRange buildRange(double value, double std_dev, double confidence);

/**
 * @brief Relative clear-sky output at an hour of day, 0 outside 06:00-18:00
 */
double clearSkyFactor(int hour);

int validForMinutes(ForecastHorizon horizon);

} // namespace forecast
} // namespace pv_watch
