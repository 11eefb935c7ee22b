#include <gtest/gtest.h>
#include "pv_watch/core/errors.h"
#include "pv_watch/forecast/production_forecaster.h"
#include "pv_watch/utils/time_utils.h"
#include <algorithm>
#include <thread>

using namespace pv_watch;
using namespace pv_watch::forecast;

class ProductionForecasterTest : public ::testing::Test {
protected:
    void SetUp() override {
        start_ = utils::fromCivil(2024, 6, 1);
        history_ = makeHistory(7);
        as_of_ = start_ + 7 * utils::MS_PER_DAY + 12 * utils::MS_PER_HOUR;

        for (int h = 0; h < 24; ++h) {
            daily_total_ += 10.0 * clearSkyFactor(h);
        }
    }

    // Hourly records where energy is exactly 1 % of irradiance
    std::vector<TelemetryRecord> makeHistory(int days) {
        std::vector<TelemetryRecord> records;
        for (int i = 0; i < days * 24; ++i) {
            int64_t ts = start_ + i * utils::MS_PER_HOUR;
            double shape = clearSkyFactor(utils::hourOfDay(ts));
            TelemetryRecord record("pv-001", ts);
            record.environmental.irradiance = 1000.0 * shape;
            record.production.energy_delta = 10.0 * shape;
            record.production.ac_power = 10.0 * shape;
            record.production.voltage = 400.0;
            record.production.frequency = 50.0;
            record.performance.performance_ratio = 0.8;
            records.push_back(record);
        }
        return records;
    }

    void expectOrderedRange(const ForecastResult& result) {
        const ForecastRange& r = result.range;
        EXPECT_GE(r.min, 0.0);
        EXPECT_LE(r.min, r.p10);
        EXPECT_LE(r.p10, r.p50);
        EXPECT_LE(r.p50, r.p90);
        EXPECT_LE(r.p90, r.max);
        EXPECT_DOUBLE_EQ(r.p50, result.value);
        EXPECT_GE(result.value, 0.0);
        EXPECT_GE(result.confidence, 0.0);
        EXPECT_LE(result.confidence, 1.0);
    }

    ProductionForecaster forecaster_;
    std::vector<TelemetryRecord> history_;
    int64_t start_ = 0;
    int64_t as_of_ = 0;
    double daily_total_ = 0.0;
};

TEST_F(ProductionForecasterTest, RejectsShortHistory) {
    std::vector<TelemetryRecord> short_history(history_.begin(), history_.begin() + 9);
    try {
        forecaster_.predict("pv-001", ForecastHorizon::DAY, short_history);
        FAIL() << "forecast from 9 records";
    } catch (const InsufficientDataError& e) {
        EXPECT_EQ(e.available(), 9u);
        EXPECT_EQ(e.required(), 10u);
    }
}

TEST_F(ProductionForecasterTest, RejectsForeignRecords) {
    history_[3].system_id = "pv-002";
    EXPECT_THROW(forecaster_.predict("pv-001", ForecastHorizon::HOUR, history_),
                 InvalidInputError);
}

TEST_F(ProductionForecasterTest, RejectsBadConfig) {
    EXPECT_THROW(ProductionForecaster(ConfigMap{{"minimum_history_records", "0"}}), InvalidInputError);
    EXPECT_THROW(ProductionForecaster(ConfigMap{{"reference_irradiance", "0"}}), InvalidInputError);
}

TEST_F(ProductionForecasterTest, HourFromHistoricalPattern) {
    ForecastResult result = forecaster_.predict("pv-001", ForecastHorizon::HOUR, history_, {}, as_of_);
    EXPECT_NEAR(result.value, 10.0, 1e-9);
    EXPECT_EQ(result.methodology, "Historical hourly pattern");
    EXPECT_DOUBLE_EQ(result.confidence, 0.85);
    EXPECT_EQ(result.valid_for_minutes, 15);
    EXPECT_EQ(result.target_time, as_of_);
    EXPECT_GT(result.generated_at, 0);
    expectOrderedRange(result);
}

TEST_F(ProductionForecasterTest, HourFromWeatherRegression) {
    std::vector<WeatherSample> weather = {
        WeatherSample(as_of_ + 20 * utils::MS_PER_MINUTE, 800.0)
    };
    ForecastResult result = forecaster_.predict("pv-001", ForecastHorizon::HOUR, history_, weather, as_of_);

    EXPECT_NEAR(result.value, 8.0, 1e-6);
    EXPECT_EQ(result.methodology,
              "Linear regression with weather correlation and historical patterns");
    bool has_weather = std::any_of(result.factors.begin(), result.factors.end(),
                                   [](const ForecastFactor& f) { return f.name == "Weather Forecast"; });
    EXPECT_TRUE(has_weather);

    // Samples further than an hour away are ignored
    weather[0].timestamp = as_of_ + 2 * utils::MS_PER_HOUR;
    result = forecaster_.predict("pv-001", ForecastHorizon::HOUR, history_, weather, as_of_);
    EXPECT_EQ(result.methodology, "Historical hourly pattern");
}

TEST_F(ProductionForecasterTest, DaySumsHourlyMeans) {
    ForecastResult result = forecaster_.predict("pv-001", ForecastHorizon::DAY, history_, {}, as_of_);
    EXPECT_NEAR(result.value, daily_total_, 1e-6);
    EXPECT_DOUBLE_EQ(result.confidence, 0.75);
    EXPECT_EQ(result.methodology, "Hourly aggregation with seasonal adjustments");
    EXPECT_EQ(result.valid_for_minutes, 240);
    expectOrderedRange(result);
}

TEST_F(ProductionForecasterTest, DayScaledByForecastIrradiance) {
    std::vector<WeatherSample> weather;
    for (int h = 0; h < 24; ++h) {
        weather.emplace_back(as_of_ + h * utils::MS_PER_HOUR, 250.0);
    }
    ForecastResult result = forecaster_.predict("pv-001", ForecastHorizon::DAY, history_, weather, as_of_);
    EXPECT_NEAR(result.value, daily_total_ * 0.5, 1e-6);
    EXPECT_EQ(result.factors.size(), 3u);
}

TEST_F(ProductionForecasterTest, WeekFromDailyAverage) {
    ForecastResult result = forecaster_.predict("pv-001", ForecastHorizon::WEEK, history_, {}, as_of_);
    EXPECT_NEAR(result.value, 7.0 * daily_total_, 1e-6);
    EXPECT_DOUBLE_EQ(result.confidence, 0.65);
    EXPECT_EQ(result.methodology, "Seasonal decomposition with trend analysis");
    EXPECT_EQ(result.valid_for_minutes, 1440);
    expectOrderedRange(result);
}

TEST_F(ProductionForecasterTest, WeekWithWeatherLowersConfidence) {
    std::vector<WeatherSample> weather = {WeatherSample(as_of_ + utils::MS_PER_HOUR, 600.0)};
    ForecastResult result = forecaster_.predict("pv-001", ForecastHorizon::WEEK, history_, weather, as_of_);
    EXPECT_NEAR(result.confidence, 0.65 * 0.9, 1e-12);
    expectOrderedRange(result);
}

TEST_F(ProductionForecasterTest, MonthCoversCalendarMonth) {
    ForecastResult result = forecaster_.predict("pv-001", ForecastHorizon::MONTH, history_, {}, as_of_);
    EXPECT_NEAR(result.value, 30.0 * daily_total_, 1e-6);
    EXPECT_DOUBLE_EQ(result.confidence, 0.55);
    EXPECT_EQ(result.methodology, "Long-term trend analysis with seasonal patterns");
    EXPECT_EQ(result.valid_for_minutes, 10080);
    expectOrderedRange(result);
}

TEST_F(ProductionForecasterTest, MonthUsesSeasonalModelWithAYearOfData) {
    // One record per day at noon for 400 days
    std::vector<TelemetryRecord> daily;
    for (int d = 0; d < 400; ++d) {
        TelemetryRecord record("pv-001", start_ + d * utils::MS_PER_DAY + 12 * utils::MS_PER_HOUR);
        record.environmental.irradiance = 900.0;
        record.production.energy_delta = 40.0;
        record.production.voltage = 400.0;
        record.production.frequency = 50.0;
        daily.push_back(record);
    }
    ForecastResult result = forecaster_.predict("pv-001", ForecastHorizon::MONTH, daily);
    ASSERT_FALSE(result.factors.empty());
    EXPECT_EQ(result.factors[0].description, "Day-of-year seasonal factors");
    EXPECT_NEAR(result.value, 40.0 * utils::daysInMonth(daily.back().timestamp), 1e-3);
}

TEST_F(ProductionForecasterTest, HistoryOrderDoesNotMatter) {
    std::vector<TelemetryRecord> reversed(history_.rbegin(), history_.rend());
    ForecastResult a = forecaster_.predict("pv-001", ForecastHorizon::DAY, history_, {}, as_of_);
    ForecastResult b = forecaster_.predict("pv-001", ForecastHorizon::DAY, reversed, {}, as_of_);
    EXPECT_DOUBLE_EQ(a.value, b.value);
}

TEST_F(ProductionForecasterTest, DefaultsToLastRecord) {
    ForecastResult result = forecaster_.predict("pv-001", ForecastHorizon::HOUR, history_);
    EXPECT_EQ(result.target_time, history_.back().timestamp);
}

TEST_F(ProductionForecasterTest, ModelsCachedUntilHistoryChanges) {
    EXPECT_EQ(forecaster_.model("pv-001"), nullptr);
    EXPECT_EQ(forecaster_.trainCount("pv-001"), 0u);

    forecaster_.predict("pv-001", ForecastHorizon::HOUR, history_, {}, as_of_);
    forecaster_.predict("pv-001", ForecastHorizon::WEEK, history_, {}, as_of_);
    EXPECT_EQ(forecaster_.trainCount("pv-001"), 1u);

    auto model = forecaster_.model("pv-001");
    ASSERT_NE(model, nullptr);
    EXPECT_NEAR(model->slope(), 0.01, 1e-9);

    history_.push_back(makeHistory(8).back());
    forecaster_.predict("pv-001", ForecastHorizon::HOUR, history_, {}, as_of_);
    EXPECT_EQ(forecaster_.trainCount("pv-001"), 2u);

    forecaster_.invalidate("pv-001");
    EXPECT_EQ(forecaster_.model("pv-001"), nullptr);
}

TEST_F(ProductionForecasterTest, ConcurrentPredictionsTrainOnce) {
    const ForecastHorizon horizons[] = {ForecastHorizon::HOUR, ForecastHorizon::DAY,
                                        ForecastHorizon::WEEK, ForecastHorizon::MONTH};
    std::vector<ForecastResult> results(8);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < results.size(); ++t) {
        threads.emplace_back([&, t]() {
            results[t] = forecaster_.predict("pv-001", horizons[t % 4], history_, {}, as_of_);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(forecaster_.trainCount("pv-001"), 1u);
    const int valid_for[] = {15, 240, 1440, 10080};
    for (size_t t = 0; t < results.size(); ++t) {
        EXPECT_EQ(results[t].valid_for_minutes, valid_for[t % 4]);
        EXPECT_GE(results[t].range.min, 0.0);
        EXPECT_DOUBLE_EQ(results[t].value, results[t % 4].value);
    }
}

TEST_F(ProductionForecasterTest, RangeHelpers) {
    ForecastRange range = buildRange(10.0, 5.0, 0.8);
    EXPECT_NEAR(range.min, 8.0, 1e-9);
    EXPECT_NEAR(range.p10, 8.7, 1e-9);
    EXPECT_NEAR(range.p90, 11.3, 1e-9);
    EXPECT_NEAR(range.max, 12.0, 1e-9);

    ForecastRange clamped = buildRange(1.0, 10.0, 0.0);
    EXPECT_DOUBLE_EQ(clamped.min, 0.0);
    EXPECT_DOUBLE_EQ(clamped.p10, 0.0);

    EXPECT_DOUBLE_EQ(clearSkyFactor(12), 1.0);
    EXPECT_DOUBLE_EQ(clearSkyFactor(3), 0.0);
    EXPECT_DOUBLE_EQ(clearSkyFactor(18), 0.0);
    EXPECT_NEAR(clearSkyFactor(9), 0.75, 1e-12);
}

TEST_F(ProductionForecasterTest, WeatherImpact) {
    SystemProfile profile;
    profile.capacity_kw = 10.0;
    int64_t noon = utils::fromCivil(2024, 6, 10) + 12 * utils::MS_PER_HOUR;

    WeatherSample clear(noon, 1000.0);
    WeatherSample cloudy(noon, 1000.0);
    cloudy.cloud_cover = 0.5;
    WeatherSample rainy(noon, 1000.0);
    rainy.precipitation = 2.0;
    WeatherSample night(noon + 12 * utils::MS_PER_HOUR, 0.0);

    auto results = forecaster_.predictWeatherImpact(profile, {clear, cloudy, rainy, night});
    ASSERT_EQ(results.size(), 4u);

    EXPECT_NEAR(results[0].value, 8.0, 1e-9);
    EXPECT_NEAR(results[1].value, 5.2, 1e-9);
    EXPECT_NEAR(results[2].value, 6.4, 1e-9);
    EXPECT_DOUBLE_EQ(results[3].value, 0.0);

    EXPECT_DOUBLE_EQ(results[0].confidence, 0.8);
    EXPECT_NEAR(results[0].range.min, 6.4, 1e-9);
    EXPECT_NEAR(results[0].range.max, 9.6, 1e-9);
    EXPECT_EQ(results[0].methodology, "weather_correlation_model");
    EXPECT_EQ(results[0].target_time, noon);
    EXPECT_EQ(results[0].valid_for_minutes, 60);
    EXPECT_EQ(results[0].factors.size(), 3u);

    EXPECT_TRUE(forecaster_.predictWeatherImpact(profile, {}).empty());
}

TEST_F(ProductionForecasterTest, Degradation) {
    std::vector<TelemetryRecord> records = makeHistory(2);
    for (auto& record : records) {
        record.performance.performance_ratio = 0.9;
    }
    SystemProfile profile;
    profile.system_age_years = 2.0;

    DegradationForecast forecast = forecaster_.predictDegradation("pv-001", records, profile);
    EXPECT_EQ(forecast.system_id, "pv-001");
    EXPECT_NEAR(forecast.current_degradation, 10.0, 1e-9);
    EXPECT_DOUBLE_EQ(forecast.degradation_rate, 0.5);
    ASSERT_EQ(forecast.projections.size(), 25u);

    const DegradationProjection& first = forecast.projections.front();
    EXPECT_EQ(first.year, 2025);
    EXPECT_NEAR(first.degradation_percent, 10.5, 1e-9);
    EXPECT_NEAR(first.production_loss, 1365.0, 1e-6);
    EXPECT_NEAR(first.lower, 10.0, 1e-9);
    EXPECT_NEAR(first.upper, 11.0, 1e-9);
    EXPECT_EQ(forecast.projections.back().year, 2049);

    ASSERT_EQ(forecast.factors.size(), 3u);
    EXPECT_DOUBLE_EQ(forecast.factors[2].impact, 1.0);
    EXPECT_NEAR(forecast.confidence, 0.82, 1e-9);
}

TEST_F(ProductionForecasterTest, DegradationOfOldSystem) {
    SystemProfile profile;
    profile.system_age_years = 30.0;
    std::vector<TelemetryRecord> records = makeHistory(1);

    DegradationForecast forecast = forecaster_.predictDegradation("pv-001", records, profile);
    EXPECT_NEAR(forecast.current_degradation, 20.0, 1e-9);
    EXPECT_DOUBLE_EQ(forecast.factors[2].impact, 1.3);
    EXPECT_DOUBLE_EQ(forecast.confidence, 0.95);

    EXPECT_THROW(forecaster_.predictDegradation("pv-001", {}, profile), InsufficientDataError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
