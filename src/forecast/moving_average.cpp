#include "pv_watch/forecast/moving_average.h"
#include <numeric>

namespace pv_watch {
namespace forecast {

MovingAverage::MovingAverage(size_t window)
    : window_(window > 0 ? window : 1) {
}

void MovingAverage::add(double value) {
    values_.push_back(value);
    if (values_.size() > window_) {
        values_.pop_front();
    }
}

double MovingAverage::predict() const {
    if (values_.empty()) {
        return 0.0;
    }
    return std::accumulate(values_.begin(), values_.end(), 0.0) / values_.size();
}

std::vector<double> MovingAverage::moving_average(const std::vector<double>& series,
                                                  size_t window) {
    std::vector<double> result;
    if (window == 0 || series.size() < window) {
        return result;
    }

    double sum = std::accumulate(series.begin(), series.begin() + window, 0.0);
    result.push_back(sum / window);
    for (size_t i = window; i < series.size(); ++i) {
        sum += series[i] - series[i - window];
        result.push_back(sum / window);
    }
    return result;
}

} // namespace forecast
} // namespace pv_watch
