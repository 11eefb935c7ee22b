#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pv_watch {
namespace forecast {

enum class ForecastHorizon {
    HOUR,
    DAY,
    WEEK,
    MONTH
};

std::string forecastHorizonToString(ForecastHorizon horizon);

/**
 * @throw InvalidInputError on unknown names
 */
ForecastHorizon stringToForecastHorizon(const std::string& str);

/**
 * @brief Prediction interval, all values non-negative at the low end
 */
struct ForecastRange {
    double min = 0.0;
    double max = 0.0;
    double p10 = 0.0;
    double p50 = 0.0;
    double p90 = 0.0;
};

struct ForecastFactor {
    std::string name;
    double impact = 0.0;
    double confidence = 0.0;
    std::string description;
};

/**
 * @brief Energy or power prediction with its uncertainty
 */
struct ForecastResult {
    double value = 0.0;         // kWh (kW for weather impact), >= 0
    double confidence = 0.0;    // 0-1
    ForecastRange range;
    std::vector<ForecastFactor> factors;
    std::string methodology;
    int64_t generated_at = 0;
    int64_t target_time = 0;    // start of the forecast period
    int valid_for_minutes = 0;
};

struct DegradationProjection {
    int year = 0;
    double degradation_percent = 0.0;
    double production_loss = 0.0;   // kWh per year against the annual target
    double lower = 0.0;
    double upper = 0.0;
};

struct DegradationFactor {
    std::string name;
    double impact = 1.0;   // acceleration factor
    std::string description;
};

/**
 * @brief Long-term degradation estimate of a system
 */
struct DegradationForecast {
    std::string system_id;
    double current_degradation = 0.0;   // %
    double degradation_rate = 0.0;      // % per year
    std::vector<DegradationProjection> projections;
    std::vector<DegradationFactor> factors;
    double confidence = 0.0;
};

} // namespace forecast
} // namespace pv_watch
