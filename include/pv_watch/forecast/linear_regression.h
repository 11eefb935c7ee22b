#pragma once

#include <vector>

namespace pv_watch {
namespace forecast {

/**
 * @brief Single-predictor ordinary least squares model
 */
class LinearRegression {
public:
    LinearRegression() = default;

    /**
     * @brief Fit y = slope * x + intercept
     * @throw InvalidInputError on empty or mismatched input
     *
     * A predictor without variance yields slope 0 and intercept mean(y).
     */
    void train(const std::vector<double>& x, const std::vector<double>& y);

    /**
     * @throw ModelNotTrainedError before train()
     */
    double predict(double x) const;

    bool isTrained() const { return trained_; }

    double slope() const { return slope_; }
    double intercept() const { return intercept_; }
    double rSquared() const { return r_squared_; }

private:
    double slope_ = 0.0;
    double intercept_ = 0.0;
    double r_squared_ = 0.0;
    bool trained_ = false;
};

} // namespace forecast
} // namespace pv_watch
