#include "pv_watch/algorithms/statistics.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace pv_watch {
namespace stats {

namespace {

double sortedPercentile(const std::vector<double>& sorted, double fraction) {
    if (sorted.empty()) {
        return 0.0;
    }
    fraction = std::clamp(fraction, 0.0, 1.0);

    double index = fraction * static_cast<double>(sorted.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(index));
    size_t upper = static_cast<size_t>(std::ceil(index));
    double weight = index - static_cast<double>(lower);

    return sorted[lower] * (1.0 - weight) + sorted[upper] * weight;
}

double sortedMedian(const std::vector<double>& sorted) {
    if (sorted.empty()) {
        return 0.0;
    }
    size_t mid = sorted.size() / 2;
    if (sorted.size() % 2 == 1) {
        return sorted[mid];
    }
    return (sorted[mid - 1] + sorted[mid]) / 2.0;
}

} // anonymous namespace

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double median(const std::vector<double>& values) {
    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    return sortedMedian(sorted);
}

double stdDev(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double m = mean(values);
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - m) * (v - m);
    }
    return std::sqrt(sq_sum / values.size());
}

double percentile(const std::vector<double>& values, double fraction) {
    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    return sortedPercentile(sorted, fraction);
}

SummaryStatistics summarize(const std::vector<double>& values) {
    SummaryStatistics summary;
    if (values.empty()) {
        return summary;
    }

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    summary.count = sorted.size();
    summary.mean = mean(sorted);
    summary.median = sortedMedian(sorted);
    summary.std_dev = stdDev(sorted);
    summary.min = sorted.front();
    summary.max = sorted.back();
    summary.p25 = sortedPercentile(sorted, 0.25);
    summary.p75 = sortedPercentile(sorted, 0.75);
    summary.p95 = sortedPercentile(sorted, 0.95);
    summary.p99 = sortedPercentile(sorted, 0.99);
    return summary;
}

LinearFit fitTrend(const std::vector<double>& values) {
    std::vector<double> x(values.size());
    std::iota(x.begin(), x.end(), 0.0);
    return fitLinear(x, values);
}

LinearFit fitLinear(const std::vector<double>& x, const std::vector<double>& y) {
    LinearFit fit;
    size_t n = std::min(x.size(), y.size());
    if (n == 0) {
        return fit;
    }

    double x_mean = 0.0;
    double y_mean = 0.0;
    for (size_t i = 0; i < n; ++i) {
        x_mean += x[i];
        y_mean += y[i];
    }
    x_mean /= n;
    y_mean /= n;

    double numerator = 0.0;
    double denominator = 0.0;
    for (size_t i = 0; i < n; ++i) {
        numerator += (x[i] - x_mean) * (y[i] - y_mean);
        denominator += (x[i] - x_mean) * (x[i] - x_mean);
    }

    fit.slope = denominator == 0.0 ? 0.0 : numerator / denominator;
    fit.intercept = y_mean - fit.slope * x_mean;

    double ss_res = 0.0;
    double ss_tot = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double predicted = fit.intercept + fit.slope * x[i];
        ss_res += (y[i] - predicted) * (y[i] - predicted);
        ss_tot += (y[i] - y_mean) * (y[i] - y_mean);
    }
    fit.r_squared = ss_tot == 0.0 ? 1.0 : 1.0 - ss_res / ss_tot;

    return fit;
}

} // namespace stats
} // namespace pv_watch
