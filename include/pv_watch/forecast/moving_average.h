#pragma once

#include <cstddef>
#include <deque>
#include <vector>

namespace pv_watch {
namespace forecast {

/**
 * @brief Rolling mean over the last `window` values
 */
class MovingAverage {
public:
    explicit MovingAverage(size_t window = 7);

    void add(double value);

    /**
     * @brief Mean of the current window, 0 when empty
     */
    double predict() const;

    size_t size() const { return values_.size(); }

    size_t window() const { return window_; }

    void reset() { values_.clear(); }

    /**
     * @brief Trailing averages of a series
     * @return One value per full window (size - window + 1), empty when the
     *         series is shorter than the window
     */
    static std::vector<double> moving_average(const std::vector<double>& series, size_t window);

private:
    size_t window_;
    std::deque<double> values_;
};

} // namespace forecast
} // namespace pv_watch
