#pragma once

#include "pv_watch/forecast/linear_regression.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace pv_watch {
namespace forecast {

/**
 * @brief Multiplicative day-of-year seasonality on top of a linear trend
 *
 * Training computes one factor per day of year (day mean / overall mean,
 * 1 where a day has no data), deseasonalises the series and fits a linear
 * trend on the sample index. Prediction is trend(t) * factor(day of year),
 * clamped to [0, 2 * historical max].
 */
class SeasonalModel {
public:
    static constexpr std::size_t MIN_SAMPLES = 365;

    SeasonalModel() = default;

    /**
     * @brief Fit the model
     * @param timestamps Sample times (ms, ascending)
     * @param values One value per timestamp
     * @throw InvalidInputError on size mismatch
     * @throw InsufficientDataError with fewer than 365 samples
     */
    void train(const std::vector<int64_t>& timestamps, const std::vector<double>& values);

    /**
     * @throw ModelNotTrainedError before train()
     */
    double predict(int64_t timestamp) const;

    double seasonalFactor(int day_of_year) const;

    bool isTrained() const { return trained_; }

    double historicalMax() const { return historical_max_; }

private:
    // Continuous index of a timestamp in sample steps from the first sample
    double indexOf(int64_t timestamp) const;

    std::array<double, 367> factors_{};
    LinearRegression trend_;
    int64_t origin_ = 0;
    int64_t step_ms_ = 0;
    double historical_max_ = 0.0;
    bool trained_ = false;
};

} // namespace forecast
} // namespace pv_watch
