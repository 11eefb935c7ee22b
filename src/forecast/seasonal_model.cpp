#include "pv_watch/forecast/seasonal_model.h"
#include "pv_watch/core/errors.h"
#include "pv_watch/utils/time_utils.h"
#include <algorithm>
#include <numeric>
#include <string>

namespace pv_watch {
namespace forecast {

void SeasonalModel::train(const std::vector<int64_t>& timestamps,
                          const std::vector<double>& values) {
    if (timestamps.size() != values.size()) {
        throw InvalidInputError("Seasonal model input size mismatch: " +
                                std::to_string(timestamps.size()) + " timestamps, " +
                                std::to_string(values.size()) + " values");
    }
    if (values.size() < MIN_SAMPLES) {
        throw InsufficientDataError("Seasonal model needs at least " +
                                    std::to_string(MIN_SAMPLES) + " samples, got " +
                                    std::to_string(values.size()),
                                    values.size(), MIN_SAMPLES);
    }

    double overall_mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();

    std::array<double, 367> sums{};
    std::array<size_t, 367> counts{};
    for (size_t i = 0; i < values.size(); ++i) {
        int doy = utils::dayOfYear(timestamps[i]);
        sums[doy] += values[i];
        counts[doy]++;
    }

    for (size_t d = 0; d < factors_.size(); ++d) {
        factors_[d] = 1.0;
        if (counts[d] > 0 && overall_mean != 0.0) {
            factors_[d] = (sums[d] / counts[d]) / overall_mean;
        }
    }

    origin_ = timestamps.front();
    step_ms_ = (timestamps.back() - timestamps.front()) /
               static_cast<int64_t>(timestamps.size() - 1);
    if (step_ms_ <= 0) {
        step_ms_ = utils::MS_PER_DAY;
    }

    std::vector<double> x;
    std::vector<double> deseasonalised;
    x.reserve(values.size());
    deseasonalised.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        double factor = seasonalFactor(utils::dayOfYear(timestamps[i]));
        x.push_back(indexOf(timestamps[i]));
        deseasonalised.push_back(factor != 0.0 ? values[i] / factor : values[i]);
    }
    trend_.train(x, deseasonalised);

    historical_max_ = *std::max_element(values.begin(), values.end());
    trained_ = true;
}

double SeasonalModel::predict(int64_t timestamp) const {
    if (!trained_) {
        throw ModelNotTrainedError("Seasonal model used before training");
    }

    double value = trend_.predict(indexOf(timestamp)) *
                   seasonalFactor(utils::dayOfYear(timestamp));
    double upper = std::max(0.0, 2.0 * historical_max_);
    return std::min(std::max(value, 0.0), upper);
}

double SeasonalModel::seasonalFactor(int day_of_year) const {
    if (day_of_year < 1 || day_of_year >= static_cast<int>(factors_.size())) {
        return 1.0;
    }
    return factors_[day_of_year];
}

double SeasonalModel::indexOf(int64_t timestamp) const {
    return static_cast<double>(timestamp - origin_) / static_cast<double>(step_ms_);
}

} // namespace forecast
} // namespace pv_watch
