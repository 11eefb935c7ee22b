#pragma once

#include <cstddef>
#include <vector>

namespace pv_watch {
namespace stats {

/**
 * @brief Descriptive statistics of a series
 */
struct SummaryStatistics {
    double mean = 0.0;
    double median = 0.0;
    double std_dev = 0.0;   // population standard deviation
    double min = 0.0;
    double max = 0.0;
    double p25 = 0.0;
    double p75 = 0.0;
    double p95 = 0.0;
    double p99 = 0.0;
    size_t count = 0;
};

/**
 * @brief Ordinary least squares line
 */
struct LinearFit {
    double slope = 0.0;
    double intercept = 0.0;
    double r_squared = 0.0;
};

double mean(const std::vector<double>& values);

double median(const std::vector<double>& values);

/**
 * @brief Population standard deviation (divides by n)
 */
double stdDev(const std::vector<double>& values);

/**
 * @brief Percentile with linear interpolation between order statistics
 * @param values Unsorted values
 * @param fraction Percentile in [0,1]
 */
double percentile(const std::vector<double>& values, double fraction);

/**
 * @brief All summary statistics in one pass over a sorted copy
 *
 * Returns a zeroed struct for an empty series.
 */
SummaryStatistics summarize(const std::vector<double>& values);

/**
 * @brief Fit y against its index 0..n-1
 *
 * R² is 1 for a constant series, slope is 0 for fewer than two points.
 */
LinearFit fitTrend(const std::vector<double>& values);

/**
 * @brief Fit y against x
 *
 * Degenerate x (zero variance) yields slope 0 and intercept mean(y).
 */
LinearFit fitLinear(const std::vector<double>& x, const std::vector<double>& y);

} // namespace stats
} // namespace pv_watch
