#include "pv_watch/forecast/linear_regression.h"
#include "pv_watch/algorithms/statistics.h"
#include "pv_watch/core/errors.h"
#include <string>

namespace pv_watch {
namespace forecast {

void LinearRegression::train(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.empty() || y.empty()) {
        throw InvalidInputError("Linear regression needs at least one sample");
    }
    if (x.size() != y.size()) {
        throw InvalidInputError("Linear regression input size mismatch: " +
                                std::to_string(x.size()) + " x values, " +
                                std::to_string(y.size()) + " y values");
    }

    stats::LinearFit fit = stats::fitLinear(x, y);
    slope_ = fit.slope;
    intercept_ = fit.intercept;
    r_squared_ = fit.r_squared;
    trained_ = true;
}

double LinearRegression::predict(double x) const {
    if (!trained_) {
        throw ModelNotTrainedError("Linear regression used before training");
    }
    return slope_ * x + intercept_;
}

} // namespace forecast
} // namespace pv_watch
